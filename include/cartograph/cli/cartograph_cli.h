#pragma once

#include <CLI/CLI.hpp>
#include <cartograph/cli/command.h>
#include <cartograph/config/config.h>
#include <cartograph/extraction/inference_client.h>
#include <cartograph/graph/graph_store.h>
#include <cartograph/pipeline/orchestrator.h>
#include <cartograph/treesitter/tree_sitter_parser.h>

#include <memory>
#include <string>
#include <vector>

namespace cartograph::cli {

/**
 * Main CLI application class
 */
class CartographCLI {
public:
    CartographCLI();
    ~CartographCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Load configuration, open the graph store and build the pipeline (lazy).
     * Safe to call from every command; only the first call does work.
     */
    Result<void> ensureInitialized();

    graph::GraphStore& getStore() { return *store_; }
    pipeline::Orchestrator& getOrchestrator() { return *orchestrator_; }
    const config::Config& getConfig() const { return config_; }

    bool getVerbose() const { return verbose_; }
    bool getJsonOutput() const { return jsonOutput_; }

private:
    Result<void> loadConfiguration();
    void applyLogLevel() const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    std::string configPath_;
    std::string dbPath_;
    bool verbose_ = false;
    bool jsonOutput_ = false;

    config::Config config_;
    std::unique_ptr<graph::GraphStore> store_;
    std::unique_ptr<treesitter::TreeSitterParser> parser_;
    std::unique_ptr<extraction::InferenceClient> inference_;
    std::unique_ptr<pipeline::Orchestrator> orchestrator_;
};

} // namespace cartograph::cli
