#pragma once

#include <cartograph/core/types.h>
#include <cartograph/extraction/plugin_process.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <string_view>

namespace cartograph::extraction {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 client over a plugin process's stdio (newline-delimited JSON).
 *
 * Requests are serialized; responses carrying an older id (a request that timed out
 * earlier) are discarded.
 *
 * @code
 * JsonRpcClient client{process};
 * auto result = client.call("infer", {{"task", "extract"}}, std::chrono::seconds{10});
 * @endcode
 */
class JsonRpcClient {
public:
    explicit JsonRpcClient(PluginProcess& process);

    /**
     * @brief Call a method and wait for its response.
     * @return The `result` member; Timeout when no response arrives in time,
     *         InferenceUnavailable when the process is gone or replied with an error.
     */
    Result<json> call(std::string_view method, const json& params,
                      std::chrono::milliseconds timeout);

    /// Fire-and-forget notification (no id, no response).
    void notify(std::string_view method, const json& params = json::object());

private:
    json build_request(int id, std::string_view method, const json& params) const;

    PluginProcess& process_;
    std::mutex mutex_;
    int next_id_{1};
};

} // namespace cartograph::extraction
