#include <cartograph/cli/cartograph_cli.h>
#include <cartograph/cli/command_registry.h>

namespace cartograph::cli {

// Factories defined next to each command implementation
std::unique_ptr<ICommand> createInitCommand();
std::unique_ptr<ICommand> createRunCommand();
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createExportCommand();
std::unique_ptr<ICommand> createImportCommand();
std::unique_ptr<ICommand> createFeedbackCommand();
std::unique_ptr<ICommand> createPurgeCommand();

void CommandRegistry::registerAllCommands(CartographCLI* cli) {
    cli->registerCommand(CommandRegistry::createInitCommand());
    cli->registerCommand(CommandRegistry::createRunCommand());
    cli->registerCommand(CommandRegistry::createStatusCommand());
    cli->registerCommand(CommandRegistry::createExportCommand());
    cli->registerCommand(CommandRegistry::createImportCommand());
    cli->registerCommand(CommandRegistry::createFeedbackCommand());
    cli->registerCommand(CommandRegistry::createPurgeCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createInitCommand() {
    return ::cartograph::cli::createInitCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createRunCommand() {
    return ::cartograph::cli::createRunCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStatusCommand() {
    return ::cartograph::cli::createStatusCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createExportCommand() {
    return ::cartograph::cli::createExportCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createImportCommand() {
    return ::cartograph::cli::createImportCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createFeedbackCommand() {
    return ::cartograph::cli::createFeedbackCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createPurgeCommand() {
    return ::cartograph::cli::createPurgeCommand();
}

} // namespace cartograph::cli
