#pragma once

#include <cartograph/config/config.h>
#include <cartograph/core/types.h>
#include <cartograph/extraction/plugin_process.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace cartograph::extraction {

class JsonRpcClient;

/**
 * @brief One question for the semantic inference capability.
 *
 * `task` is `extract` (field values for a file skeleton), `classify` (component type)
 * or `map` (target component for an unrecognized component). `context` carries the
 * skeleton or surrounding metadata.
 */
struct InferenceRequest {
    std::string task;
    std::string projectId;
    std::string path;
    std::string language;
    nlohmann::json context = nlohmann::json::object();

    nlohmann::json toJson() const;
};

/**
 * @brief Best-effort, unreliable semantic inference.
 *
 * Every call is bounded by `timeout`. Failures are InferenceUnavailable or Timeout;
 * callers continue with syntactic data only. Implementations must be safe to call
 * from several extraction workers at once.
 */
class InferenceClient {
public:
    virtual ~InferenceClient() = default;

    virtual Result<nlohmann::json> infer(const InferenceRequest& request,
                                         std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Inference through an external plugin process speaking JSON-RPC (`infer`).
 *
 * The process is spawned on first use and respawned after it dies. Calls are
 * serialized over the single process.
 */
class PluginInferenceClient final : public InferenceClient {
public:
    explicit PluginInferenceClient(PluginProcessConfig config);
    ~PluginInferenceClient() override;

    Result<nlohmann::json> infer(const InferenceRequest& request,
                                 std::chrono::milliseconds timeout) override;

private:
    Result<void> ensureStarted();

    PluginProcessConfig config_;
    std::mutex mutex_;
    std::unique_ptr<PluginProcess> process_;
    // Outlives single calls so late replies to timed-out ids are recognized
    std::unique_ptr<JsonRpcClient> rpc_;
};

/// Plugin-backed client for `cfg`, or nullptr when inference is disabled.
std::unique_ptr<InferenceClient> makeInferenceClient(const config::InferenceConfig& cfg);

} // namespace cartograph::extraction
