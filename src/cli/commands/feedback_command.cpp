#include <cartograph/cli/cartograph_cli.h>
#include <cartograph/cli/command.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>

namespace cartograph::cli {

class FeedbackCommand : public ICommand {
public:
    std::string getName() const override { return "feedback"; }

    std::string getDescription() const override {
        return "Acknowledge review of a project waiting for feedback";
    }

    void registerCommand(CLI::App& app, CartographCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("feedback", getDescription());
        cmd->add_option("project", projectId_, "Project id")->required();
        cmd->add_option("-m,--message", message_, "Note recorded with the acknowledgement");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Feedback failed: {}", result.error().message);
                std::exit(1);
            }
        });
    }

    Result<void> execute() override {
        auto initR = cli_->ensureInitialized();
        if (!initR)
            return initR;

        std::optional<std::string> message;
        if (!message_.empty())
            message = message_;
        auto projectR = cli_->getOrchestrator().acknowledgeFeedback(projectId_, message);
        if (!projectR)
            return projectR.error();

        const auto& project = projectR.value();
        if (cli_->getJsonOutput()) {
            nlohmann::json out = project.toProperties();
            out["id"] = project.id;
            std::cout << out.dump(2) << std::endl;
        } else {
            std::cout << "Project " << project.id << " resumed at "
                      << model::toString(project.status) << std::endl;
        }
        return Result<void>();
    }

private:
    CartographCLI* cli_ = nullptr;
    std::string projectId_;
    std::string message_;
};

std::unique_ptr<ICommand> createFeedbackCommand() {
    return std::make_unique<FeedbackCommand>();
}

} // namespace cartograph::cli
