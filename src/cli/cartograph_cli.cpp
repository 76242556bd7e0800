#include <cartograph/cli/cartograph_cli.h>
#include <cartograph/cli/command_registry.h>
#include <cartograph/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace cartograph::cli {

namespace fs = std::filesystem;

CartographCLI::CartographCLI() {
    app_ = std::make_unique<CLI::App>("Cartograph - legacy code metadata graph", "cartograph");
    app_->require_subcommand(1);

    app_->add_option("-c,--config", configPath_, "Configuration file (TOML)");
    app_->add_option("--db", dbPath_, "Graph database path (overrides configuration)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");

    CommandRegistry::registerAllCommands(this);
}

CartographCLI::~CartographCLI() {
    // The orchestrator borrows the store, parser and inference client
    orchestrator_.reset();
    inference_.reset();
    parser_.reset();
    store_.reset();
}

void CartographCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

int CartographCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }
    return 0;
}

Result<void> CartographCLI::loadConfiguration() {
    const auto path = config::get_config_path(configPath_);
    auto cfgR = config::loadConfig(path);
    if (!cfgR)
        return cfgR.error();
    config_ = std::move(cfgR).value();
    config::applyEnvironmentOverrides(config_);
    if (!dbPath_.empty())
        config_.store.path = config::expand_tilde(dbPath_);
    applyLogLevel();
    spdlog::debug("Configuration loaded from {}", path.string());
    return Result<void>();
}

void CartographCLI::applyLogLevel() const {
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
        return;
    }
    auto level = spdlog::level::from_str(config_.logLevel);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && config_.logLevel != "off") {
        spdlog::warn("Unknown log level '{}', keeping warn", config_.logLevel);
        return;
    }
    spdlog::set_level(level);
}

Result<void> CartographCLI::ensureInitialized() {
    if (orchestrator_)
        return Result<void>();

    auto cfgR = loadConfiguration();
    if (!cfgR)
        return cfgR;

    if (auto parent = config_.store.path.parent_path(); !parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec)
            return Error{ErrorCode::PermissionDenied,
                         "Cannot create " + parent.string() + ": " + ec.message()};
    }

    graph::SqliteGraphStoreConfig storeCfg;
    storeCfg.pool.maxConnections = config_.store.poolSize;
    storeCfg.pool.busyTimeout = config_.store.busyTimeout;
    storeCfg.pool.acquireTimeout = config_.store.acquireTimeout;
    auto storeR = graph::makeSqliteGraphStore(config_.store.path.string(), storeCfg);
    if (!storeR)
        return storeR.error();
    store_ = std::move(storeR).value();

    parser_ = std::make_unique<treesitter::TreeSitterParser>(
        std::make_shared<treesitter::GrammarLoader>());
    inference_ = extraction::makeInferenceClient(config_.inference);
    if (!inference_)
        spdlog::debug("Semantic inference disabled; syntactic extraction only");

    orchestrator_ = std::make_unique<pipeline::Orchestrator>(
        *store_, *parser_, inference_.get(), pipeline::OrchestratorOptions::fromConfig(config_));
    spdlog::debug("Graph store opened at {}", config_.store.path.string());
    return Result<void>();
}

} // namespace cartograph::cli
