#include <cartograph/cli/cartograph_cli.h>
#include <cartograph/cli/command.h>
#include <cartograph/graph/graph_export.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace cartograph::cli {

class ExportCommand : public ICommand {
public:
    std::string getName() const override { return "export"; }

    std::string getDescription() const override {
        return "Export a project graph as JSON or CSV";
    }

    void registerCommand(CLI::App& app, CartographCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("export", getDescription());
        cmd->add_option("project", projectId_, "Project id")->required();
        cmd->add_option("-f,--format", format_, "Output format")
            ->check(CLI::IsMember({"json", "csv"}))
            ->default_val("json");
        cmd->add_option("-o,--out", out_,
                        "Output file (json, stdout when omitted) or directory (csv)");
        cmd->add_option("--labels", labels_, "Only these node labels (e.g. File,Class)")
            ->delimiter(',');
        cmd->add_option("--relations", relations_, "Only these relations (e.g. IMPORTS)")
            ->delimiter(',');

        cmd->callback([this]() {
            auto result = execute();
            if (!result) {
                spdlog::error("Export failed: {}", result.error().message);
                std::exit(1);
            }
        });
    }

    Result<void> execute() override {
        auto initR = cli_->ensureInitialized();
        if (!initR)
            return initR;

        graph::ExportFilter filter;
        for (const auto& name : labels_) {
            auto label = model::parseNodeLabel(name);
            if (!label)
                return Error{ErrorCode::InvalidArgument, "Unknown node label: " + name};
            filter.labels.push_back(*label);
        }
        for (const auto& name : relations_) {
            auto relation = model::parseRelation(name);
            if (!relation)
                return Error{ErrorCode::InvalidArgument, "Unknown relation: " + name};
            filter.relations.push_back(*relation);
        }

        if (format_ == "csv") {
            if (out_.empty())
                return Error{ErrorCode::InvalidArgument, "CSV export needs --out <directory>"};
            auto csvR = graph::exportCsv(cli_->getStore(), projectId_, out_, filter);
            if (!csvR)
                return csvR;
            spdlog::info("Exported {} to {}", projectId_, out_);
            return Result<void>();
        }

        auto docR = graph::exportJson(cli_->getStore(), projectId_, filter);
        if (!docR)
            return docR.error();
        if (out_.empty()) {
            std::cout << docR.value().dump(2) << std::endl;
            return Result<void>();
        }
        std::ofstream file(out_);
        if (!file)
            return Error{ErrorCode::PermissionDenied, "Cannot write " + out_};
        file << docR.value().dump(2) << '\n';
        if (!file)
            return Error{ErrorCode::InternalError, "Write to " + out_ + " failed"};
        spdlog::info("Exported {} nodes and {} edges to {}", docR.value()["nodes"].size(),
                     docR.value()["edges"].size(), out_);
        return Result<void>();
    }

private:
    CartographCLI* cli_ = nullptr;
    std::string projectId_;
    std::string format_ = "json";
    std::string out_;
    std::vector<std::string> labels_;
    std::vector<std::string> relations_;
};

std::unique_ptr<ICommand> createExportCommand() {
    return std::make_unique<ExportCommand>();
}

} // namespace cartograph::cli
