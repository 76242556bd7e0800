#include <cartograph/cli/cartograph_cli.h>
#include <cartograph/cli/command.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>

namespace cartograph::cli {

using model::ProjectStatus;

class RunCommand : public ICommand {
public:
    std::string getName() const override { return "run"; }

    std::string getDescription() const override {
        return "Drive a project through the extraction pipeline";
    }

    void registerCommand(CLI::App& app, CartographCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("run", getDescription());
        cmd->add_option("project", projectId_, "Project id")->required();
        cmd->add_flag("--step", step_, "Run a single stage and stop");
        cmd->add_flag("--resume", resume_, "Restart a failed project from its last state");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Run failed: {}", result.error().message);
                std::exit(1);
            }
        });
    }

    Result<void> execute() override {
        auto initR = cli_->ensureInitialized();
        if (!initR)
            return initR;
        auto& orchestrator = cli_->getOrchestrator();

        const bool json = cli_->getJsonOutput();
        orchestrator.onStateChange([json](const pipeline::StateChange& change) {
            if (json)
                return;
            std::cout << "[" << static_cast<int>(change.progress) << "%] "
                      << model::toString(change.from) << " -> " << model::toString(change.to);
            if (!change.step.empty())
                std::cout << " (" << change.step << ")";
            std::cout << std::endl;
        });

        if (resume_) {
            auto resumeR = orchestrator.resume(projectId_);
            if (!resumeR)
                return resumeR.error();
        }

        auto projectR = step_ ? orchestrator.advance(projectId_) : orchestrator.run(projectId_);
        if (!projectR)
            return projectR.error();
        const auto& project = projectR.value();

        if (json) {
            nlohmann::json out = project.toProperties();
            out["id"] = project.id;
            std::cout << out.dump(2) << std::endl;
        } else if (project.status == ProjectStatus::NeedsFeedback) {
            std::cout << "Project " << project.id
                      << " needs feedback; review it and run `cartograph feedback " << project.id
                      << "`" << std::endl;
        } else {
            std::cout << "Project " << project.id << ": " << model::toString(project.status)
                      << std::endl;
        }

        if (project.status == ProjectStatus::Failed)
            return Error{ErrorCode::InvalidState,
                         "Project " + project.id + " failed during " + project.currentStep};
        return Result<void>();
    }

private:
    CartographCLI* cli_ = nullptr;
    std::string projectId_;
    bool step_ = false;
    bool resume_ = false;
};

std::unique_ptr<ICommand> createRunCommand() {
    return std::make_unique<RunCommand>();
}

} // namespace cartograph::cli
