#include <cartograph/cli/cartograph_cli.h>
#include <cartograph/cli/command.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>

namespace cartograph::cli {

class PurgeCommand : public ICommand {
public:
    std::string getName() const override { return "purge"; }

    std::string getDescription() const override {
        return "Delete a project and its whole graph";
    }

    void registerCommand(CLI::App& app, CartographCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("purge", getDescription());
        cmd->add_option("project", projectId_, "Project id")->required();
        cmd->add_flag("-f,--force", force_, "Skip confirmation");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Purge failed: {}", result.error().message);
                std::exit(1);
            }
        });
    }

    Result<void> execute() override {
        auto initR = cli_->ensureInitialized();
        if (!initR)
            return initR;

        auto projectR = cli_->getStore().getProject(projectId_);
        if (!projectR)
            return projectR.error();

        if (!force_) {
            std::cout << "Delete project " << projectId_ << " (" << projectR.value().rootPath
                      << ")? [y/N]: ";
            std::string answer;
            std::getline(std::cin, answer);
            if (answer != "y" && answer != "Y") {
                std::cout << "Aborted" << std::endl;
                return Result<void>();
            }
        }

        auto purgeR = cli_->getStore().purgeProject(projectId_);
        if (!purgeR)
            return purgeR;
        std::cout << "Purged " << projectId_ << std::endl;
        return Result<void>();
    }

private:
    CartographCLI* cli_ = nullptr;
    std::string projectId_;
    bool force_ = false;
};

std::unique_ptr<ICommand> createPurgeCommand() {
    return std::make_unique<PurgeCommand>();
}

} // namespace cartograph::cli
