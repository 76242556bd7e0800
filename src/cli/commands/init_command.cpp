#include <cartograph/cli/cartograph_cli.h>
#include <cartograph/cli/command.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <iostream>
#include <optional>

namespace cartograph::cli {

namespace fs = std::filesystem;

class InitCommand : public ICommand {
public:
    std::string getName() const override { return "init"; }

    std::string getDescription() const override {
        return "Register a legacy source tree as a new project";
    }

    void registerCommand(CLI::App& app, CartographCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("init", getDescription());
        cmd->add_option("root", root_, "Root directory of the legacy code")->required();
        cmd->add_option("--id", projectId_, "Project id (generated when omitted)");
        cmd->add_option("--mappings", mappingsPath_,
                        "JSON file with custom mappings ({\"components\":{}, \"types\":{}})");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Init failed: {}", result.error().message);
                std::exit(1);
            }
        });
    }

    Result<void> execute() override {
        auto initR = cli_->ensureInitialized();
        if (!initR)
            return initR;

        auto mappings = nlohmann::json::object();
        if (!mappingsPath_.empty()) {
            auto mappingsR = readMappings(mappingsPath_);
            if (!mappingsR)
                return mappingsR.error();
            mappings = std::move(mappingsR).value();
        }

        std::optional<std::string> id;
        if (!projectId_.empty())
            id = projectId_;

        auto projectR = cli_->getOrchestrator().createProject(fs::absolute(root_), id, mappings);
        if (!projectR)
            return projectR.error();
        const auto& project = projectR.value();

        if (cli_->getJsonOutput()) {
            nlohmann::json out = project.toProperties();
            out["id"] = project.id;
            std::cout << out.dump(2) << std::endl;
        } else {
            std::cout << project.id << std::endl;
        }
        return Result<void>();
    }

private:
    static Result<nlohmann::json> readMappings(const fs::path& path) {
        std::ifstream in(path);
        if (!in)
            return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
        try {
            auto doc = nlohmann::json::parse(in);
            if (!doc.is_object())
                return Error{ErrorCode::InvalidArgument,
                             "Custom mappings must be a JSON object: " + path.string()};
            return doc;
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorCode::InvalidArgument,
                         "Invalid mappings file " + path.string() + ": " + e.what()};
        }
    }

    CartographCLI* cli_ = nullptr;
    std::string root_;
    std::string projectId_;
    std::string mappingsPath_;
};

std::unique_ptr<ICommand> createInitCommand() {
    return std::make_unique<InitCommand>();
}

} // namespace cartograph::cli
