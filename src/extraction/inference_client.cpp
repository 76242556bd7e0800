#include <cartograph/extraction/inference_client.h>
#include <cartograph/extraction/jsonrpc_client.h>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace cartograph::extraction {

nlohmann::json InferenceRequest::toJson() const {
    return {{"task", task},
            {"project_id", projectId},
            {"path", path},
            {"language", language},
            {"context", context}};
}

PluginInferenceClient::PluginInferenceClient(PluginProcessConfig config)
    : config_(std::move(config)) {}

PluginInferenceClient::~PluginInferenceClient() {
    std::lock_guard lock{mutex_};
    if (process_ && process_->is_alive()) {
        rpc_->notify("shutdown");
        process_->terminate(std::chrono::seconds{2});
    }
}

Result<void> PluginInferenceClient::ensureStarted() {
    if (process_ && process_->is_alive())
        return {};
    if (process_) {
        spdlog::warn("Inference plugin (pid={}) exited with code {}; respawning", process_->pid(),
                     process_->exit_code().value_or(-1));
        rpc_.reset();
        process_.reset();
    }
    try {
        process_ = std::make_unique<PluginProcess>(config_);
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::InferenceUnavailable,
                     std::string("Failed to start inference plugin: ") + e.what()};
    }
    rpc_ = std::make_unique<JsonRpcClient>(*process_);
    return {};
}

Result<nlohmann::json> PluginInferenceClient::infer(const InferenceRequest& request,
                                                    std::chrono::milliseconds timeout) {
    std::lock_guard lock{mutex_};
    auto started = ensureStarted();
    if (!started)
        return started.error();

    try {
        auto result = rpc_->call("infer", request.toJson(), timeout);
        if (!result)
            return result.error();
        if (!result.value().is_object()) {
            return Error{ErrorCode::InferenceUnavailable,
                         "Inference result for " + request.path + " is not an object"};
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        // Source text that is not valid UTF-8 cannot be serialized into the request
        return Error{ErrorCode::InferenceUnavailable,
                     fmt::format("Inference request for {} failed: {}", request.path, e.what())};
    }
}

std::unique_ptr<InferenceClient> makeInferenceClient(const config::InferenceConfig& cfg) {
    if (!cfg.enabled || cfg.command.empty())
        return nullptr;
    PluginProcessConfig pc;
    pc.executable = cfg.command;
    pc.args = cfg.args;
    pc.with_env("PYTHONUNBUFFERED", "1");
    return std::make_unique<PluginInferenceClient>(std::move(pc));
}

} // namespace cartograph::extraction
