#include <cartograph/config/config.h>
#include <cartograph/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <thread>

namespace cartograph::config {

namespace {

template <typename T> bool parseNumber(const std::string& raw, T& out) {
    if (raw.empty()) {
        return true;
    }
    try {
        long long v = std::stoll(raw);
        if (v < 0) {
            return false;
        }
        out = static_cast<T>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseBool(const std::string& raw, bool fallback) {
    if (raw == "true" || raw == "1" || raw == "yes") {
        return true;
    }
    if (raw == "false" || raw == "0" || raw == "no") {
        return false;
    }
    return fallback;
}

} // namespace

size_t Config::effectiveWorkers() const {
    if (extraction.workers > 0) {
        return extraction.workers;
    }
    auto hc = std::thread::hardware_concurrency();
    return hc == 0 ? 1 : hc;
}

Config defaultConfig() {
    Config cfg;
    cfg.store.path = get_data_dir() / "graph.db";
    return cfg;
}

Result<Config> loadConfig(const std::filesystem::path& path) {
    Config cfg = defaultConfig();
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("Config file {} not found, using defaults", path.string());
        return cfg;
    }

    auto get = [&](const char* section, const char* key) {
        return parse_config_value(path, section, key);
    };
    auto bad = [&](const char* section, const char* key) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid value for ") + section + "." + key + " in " +
                         path.string()};
    };

    if (auto v = get("store", "path"); !v.empty()) {
        cfg.store.path = expand_tilde(v);
    }
    if (!parseNumber(get("store", "pool_size"), cfg.store.poolSize) || cfg.store.poolSize == 0) {
        return bad("store", "pool_size");
    }
    if (auto v = get("store", "busy_timeout_ms"); !v.empty()) {
        cfg.store.busyTimeout = parse_ms(v);
    }
    if (auto v = get("store", "acquire_timeout_ms"); !v.empty()) {
        cfg.store.acquireTimeout = parse_ms(v);
    }

    if (!parseNumber(get("extraction", "workers"), cfg.extraction.workers)) {
        return bad("extraction", "workers");
    }
    if (!parseNumber(get("extraction", "max_file_size"), cfg.extraction.maxFileSize)) {
        return bad("extraction", "max_file_size");
    }
    cfg.extraction.skipHidden = parseBool(get("extraction", "skip_hidden"), true);

    cfg.inference.command = get("inference", "command");
    if (auto v = get("inference", "args"); !v.empty()) {
        cfg.inference.args = parse_string_list(v);
    }
    if (auto v = get("inference", "timeout_ms"); !v.empty()) {
        cfg.inference.timeout = parse_ms(v);
    }
    cfg.inference.enabled =
        parseBool(get("inference", "enabled"), !cfg.inference.command.empty());

    if (!parseNumber(get("resolver", "closure_depth"), cfg.resolver.closureDepth) ||
        cfg.resolver.closureDepth < 1) {
        return bad("resolver", "closure_depth");
    }

    if (!parseNumber(get("pipeline", "max_attempts"), cfg.pipeline.maxAttempts) ||
        cfg.pipeline.maxAttempts < 1) {
        return bad("pipeline", "max_attempts");
    }
    if (auto v = get("pipeline", "backoff_initial_ms"); !v.empty()) {
        cfg.pipeline.backoffInitial = parse_ms(v);
    }
    if (auto v = get("pipeline", "backoff_max_ms"); !v.empty()) {
        cfg.pipeline.backoffMax = parse_ms(v);
    }

    if (auto v = get("logging", "level"); !v.empty()) {
        cfg.logLevel = v;
    }

    spdlog::debug("Loaded config from {}", path.string());
    return cfg;
}

void applyEnvironmentOverrides(Config& cfg) {
    if (auto v = env_value("CARTOGRAPH_DB_PATH")) {
        cfg.store.path = expand_tilde(*v);
    }
    if (auto v = env_value("CARTOGRAPH_WORKERS")) {
        size_t workers = 0;
        if (parseNumber(*v, workers)) {
            cfg.extraction.workers = workers;
        } else {
            spdlog::warn("Ignoring invalid CARTOGRAPH_WORKERS='{}'", *v);
        }
    }
    if (auto v = env_value("CARTOGRAPH_INFERENCE_CMD")) {
        cfg.inference.command = *v;
        cfg.inference.enabled = true;
    }
    if (auto v = env_value("CARTOGRAPH_LOG_LEVEL")) {
        cfg.logLevel = *v;
    }
}

} // namespace cartograph::config
