#include <cartograph/cli/cartograph_cli.h>
#include <cartograph/cli/command.h>
#include <cartograph/graph/graph_export.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <cstdlib>
#include <iostream>
#include <optional>

namespace cartograph::cli {

class ImportCommand : public ICommand {
public:
    std::string getName() const override { return "import"; }

    std::string getDescription() const override {
        return "Import a graph previously written by `export --format json`";
    }

    void registerCommand(CLI::App& app, CartographCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("import", getDescription());
        cmd->add_option("file", file_, "Exported JSON document")
            ->required()
            ->check(CLI::ExistingFile);
        cmd->add_option("--project", projectId_, "Target project id (defaults to the document's)");

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Import failed: {}", result.error().message);
                std::exit(1);
            }
        });
    }

    Result<void> execute() override {
        auto initR = cli_->ensureInitialized();
        if (!initR)
            return initR;

        std::ifstream in(file_);
        if (!in)
            return Error{ErrorCode::FileNotFound, "Cannot open " + file_};
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(in);
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorCode::InvalidData, "Invalid export document: " + std::string(e.what())};
        }

        std::optional<std::string> target;
        if (!projectId_.empty())
            target = projectId_;
        auto importR = graph::importJson(cli_->getStore(), doc, target);
        if (!importR)
            return importR.error();

        if (cli_->getJsonOutput())
            std::cout << nlohmann::json{{"project", importR.value()}}.dump(2) << std::endl;
        else
            std::cout << "Imported into " << importR.value() << std::endl;
        return Result<void>();
    }

private:
    CartographCLI* cli_ = nullptr;
    std::string file_;
    std::string projectId_;
};

std::unique_ptr<ICommand> createImportCommand() {
    return std::make_unique<ImportCommand>();
}

} // namespace cartograph::cli
