#include <cartograph/cli/cartograph_cli.h>
#include <cartograph/cli/command.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iomanip>
#include <cstdlib>
#include <iostream>

namespace cartograph::cli {

using model::NodeLabel;

class StatusCommand : public ICommand {
public:
    std::string getName() const override { return "status"; }

    std::string getDescription() const override {
        return "Show pipeline state of one project, or list all projects";
    }

    void registerCommand(CLI::App& app, CartographCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("status", getDescription());
        cmd->add_option("project", projectId_, "Project id (lists projects when omitted)");
        cmd->add_flag("--reports", showReports_, "Include reports and open feedback");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Status command failed: {}", result.error().message);
                std::exit(1);
            }
        });
    }

    Result<void> execute() override {
        auto initR = cli_->ensureInitialized();
        if (!initR)
            return initR;
        return projectId_.empty() ? listProjects() : showProject();
    }

private:
    Result<void> listProjects() {
        auto projectsR = cli_->getStore().listProjects();
        if (!projectsR)
            return projectsR.error();

        if (cli_->getJsonOutput()) {
            auto out = nlohmann::json::array();
            for (const auto& p : projectsR.value()) {
                auto entry = p.toProperties();
                entry["id"] = p.id;
                out.push_back(std::move(entry));
            }
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }

        if (projectsR.value().empty()) {
            std::cout << "No projects" << std::endl;
            return Result<void>();
        }
        for (const auto& p : projectsR.value()) {
            std::cout << std::left << std::setw(36) << p.id << " " << std::setw(20)
                      << model::toString(p.status) << " " << std::right << std::setw(5)
                      << static_cast<int>(p.progress) << "%  " << p.rootPath << "\n";
        }
        std::cout.flush();
        return Result<void>();
    }

    Result<void> showProject() {
        auto& store = cli_->getStore();
        auto projectR = store.getProject(projectId_);
        if (!projectR)
            return projectR.error();
        const auto& project = projectR.value();

        nlohmann::json counts = nlohmann::json::object();
        for (auto label : model::allNodeLabels()) {
            if (label == NodeLabel::Project)
                continue;
            auto countR = store.countNodes(projectId_, label);
            if (!countR)
                return countR.error();
            counts[model::toString(label)] = countR.value();
        }

        nlohmann::json reports = nlohmann::json::array();
        nlohmann::json feedback = nlohmann::json::array();
        if (showReports_) {
            auto reportsR = collect(NodeLabel::Report);
            if (!reportsR)
                return reportsR.error();
            reports = std::move(reportsR).value();
            auto feedbackR = collect(NodeLabel::Feedback);
            if (!feedbackR)
                return feedbackR.error();
            feedback = std::move(feedbackR).value();
        }

        if (cli_->getJsonOutput()) {
            nlohmann::json out = project.toProperties();
            out["id"] = project.id;
            out["counts"] = counts;
            if (showReports_) {
                out["reports"] = reports;
                out["feedback"] = feedback;
            }
            std::cout << out.dump(2) << std::endl;
            return Result<void>();
        }

        std::cout << "Project:  " << project.id << "\n"
                  << "Root:     " << project.rootPath << "\n"
                  << "Status:   " << model::toString(project.status) << "\n"
                  << "Progress: " << static_cast<int>(project.progress) << "%\n";
        if (!project.currentStep.empty())
            std::cout << "Step:     " << project.currentStep << "\n";
        if (project.resumeStatus)
            std::cout << "Resumes:  " << model::toString(*project.resumeStatus) << "\n";
        std::cout << "\nNodes:\n";
        for (auto it = counts.begin(); it != counts.end(); ++it) {
            if (it->get<int64_t>() > 0)
                std::cout << "  " << std::left << std::setw(16) << it.key() << it->get<int64_t>()
                          << "\n";
        }
        if (showReports_) {
            print("Reports", reports);
            print("Feedback", feedback);
        }
        std::cout.flush();
        return Result<void>();
    }

    Result<nlohmann::json> collect(NodeLabel label) {
        auto nodesR = cli_->getStore().findNodes(projectId_, label);
        if (!nodesR)
            return nodesR.error();
        auto out = nlohmann::json::array();
        for (const auto& node : nodesR.value()) {
            auto entry = model::ReportRecord::fromProperties(node.key, node.properties).toProperties();
            entry["id"] = node.key;
            out.push_back(std::move(entry));
        }
        return out;
    }

    static void print(const char* title, const nlohmann::json& entries) {
        std::cout << "\n" << title << " (" << entries.size() << "):\n";
        for (const auto& e : entries) {
            std::cout << "  [" << e.value("type", std::string{}) << "] "
                      << e.value("issue", std::string{}) << "\n";
        }
    }

    CartographCLI* cli_ = nullptr;
    std::string projectId_;
    bool showReports_ = false;
};

std::unique_ptr<ICommand> createStatusCommand() {
    return std::make_unique<StatusCommand>();
}

} // namespace cartograph::cli
