#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <cartograph/core/types.h>

namespace cartograph::config {

struct StoreConfig {
    std::filesystem::path path;
    size_t poolSize = 4;
    std::chrono::milliseconds busyTimeout{5000};
    std::chrono::milliseconds acquireTimeout{5000};
};

struct ExtractionConfig {
    size_t workers = 0; // 0 = hardware concurrency
    uint64_t maxFileSize = 500 * 1024;
    bool skipHidden = true;
};

struct InferenceConfig {
    bool enabled = false;
    std::string command;
    std::vector<std::string> args;
    std::chrono::milliseconds timeout{60000};
};

struct ResolverConfig {
    int closureDepth = 3;
};

struct PipelineConfig {
    int maxAttempts = 4;
    std::chrono::milliseconds backoffInitial{200};
    std::chrono::milliseconds backoffMax{5000};
};

/**
 * @brief Complete runtime configuration.
 *
 * Populated from defaults, then the TOML config file, then CARTOGRAPH_* environment
 * variables (highest precedence).
 */
struct Config {
    StoreConfig store;
    ExtractionConfig extraction;
    InferenceConfig inference;
    ResolverConfig resolver;
    PipelineConfig pipeline;
    std::string logLevel = "info";

    size_t effectiveWorkers() const;
};

/// Defaults with data directories resolved for the current user.
Config defaultConfig();

/// Load configuration from a TOML file; a missing file yields defaults.
Result<Config> loadConfig(const std::filesystem::path& path);

/// Apply CARTOGRAPH_DB_PATH, CARTOGRAPH_WORKERS, CARTOGRAPH_INFERENCE_CMD, CARTOGRAPH_LOG_LEVEL.
void applyEnvironmentOverrides(Config& cfg);

} // namespace cartograph::config
