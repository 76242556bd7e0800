#pragma once

#include <cartograph/cli/command.h>

#include <memory>

namespace cartograph::cli {

class CartographCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(CartographCLI* cli);

    static std::unique_ptr<ICommand> createInitCommand();
    static std::unique_ptr<ICommand> createRunCommand();
    static std::unique_ptr<ICommand> createStatusCommand();
    static std::unique_ptr<ICommand> createExportCommand();
    static std::unique_ptr<ICommand> createImportCommand();
    static std::unique_ptr<ICommand> createFeedbackCommand();
    static std::unique_ptr<ICommand> createPurgeCommand();
};

} // namespace cartograph::cli
