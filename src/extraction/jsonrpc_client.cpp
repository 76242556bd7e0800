#include <cartograph/extraction/jsonrpc_client.h>
#include <cartograph/model/entities.h>

#include <spdlog/spdlog.h>

#include <span>
#include <string>

namespace cartograph::extraction {

namespace {

bool writeLine(PluginProcess& process, const std::string& line) {
    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(line.data()), line.size()};
    return process.write_stdin(bytes) == line.size();
}

} // namespace

JsonRpcClient::JsonRpcClient(PluginProcess& process) : process_(process) {}

Result<json> JsonRpcClient::call(std::string_view method, const json& params,
                                 std::chrono::milliseconds timeout) {
    std::lock_guard lock{mutex_};

    if (!process_.is_alive()) {
        return Error{ErrorCode::InferenceUnavailable,
                     fmt::format("Plugin process not alive, cannot call '{}'", method)};
    }

    const int id = next_id_++;
    std::string request = build_request(id, method, params).dump() + "\n";
    spdlog::debug("JsonRpcClient: sending id={} method='{}'", id, method);
    if (!writeLine(process_, request)) {
        return Error{ErrorCode::InferenceUnavailable,
                     fmt::format("Failed to write request '{}' to plugin", method)};
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            break;

        auto line = process_.read_line(remaining);
        if (!line) {
            if (!process_.is_alive()) {
                return Error{ErrorCode::InferenceUnavailable,
                             fmt::format("Plugin exited while waiting for '{}'", method)};
            }
            continue;
        }
        if (line->empty())
            continue;

        json response;
        try {
            response = json::parse(*line);
        } catch (const json::parse_error& e) {
            spdlog::warn("JsonRpcClient: ignoring non-JSON output line: {}", e.what());
            continue;
        }

        if (!response.is_object()) {
            return Error{ErrorCode::InferenceUnavailable, "JSON-RPC response is not an object"};
        }
        if (model::property<std::string>(response, "jsonrpc", "") != "2.0") {
            return Error{ErrorCode::InferenceUnavailable, "Invalid JSON-RPC version in response"};
        }

        int responseId = response.contains("id") && response["id"].is_number_integer()
                             ? response["id"].get<int>()
                             : -1;
        if (responseId != id) {
            spdlog::debug("JsonRpcClient: discarding response for old id={} (expected {})",
                          responseId, id);
            continue;
        }

        if (response.contains("error")) {
            const auto& err = response["error"];
            if (!err.is_object()) {
                return Error{ErrorCode::InferenceUnavailable,
                             fmt::format("RPC error for '{}': {}", method, err.dump())};
            }
            return Error{ErrorCode::InferenceUnavailable,
                         fmt::format("RPC error for '{}': code={}, message={}", method,
                                     model::property<int>(err, "code", -1),
                                     model::property<std::string>(err, "message", "unknown"))};
        }
        if (!response.contains("result")) {
            return Error{ErrorCode::InferenceUnavailable, "Response missing 'result' field"};
        }
        return response["result"];
    }

    spdlog::warn("JsonRpcClient: timeout after {}ms waiting for '{}' (id={})", timeout.count(),
                 method, id);
    return Error{ErrorCode::Timeout,
                 fmt::format("No response to '{}' within {}ms", method, timeout.count())};
}

void JsonRpcClient::notify(std::string_view method, const json& params) {
    if (!process_.is_alive()) {
        spdlog::warn("JsonRpcClient: process not alive, dropping notification '{}'", method);
        return;
    }
    json notification = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
    if (!writeLine(process_, notification.dump() + "\n")) {
        spdlog::warn("JsonRpcClient: failed to send notification '{}'", method);
    }
}

json JsonRpcClient::build_request(int id, std::string_view method, const json& params) const {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

} // namespace cartograph::extraction
