#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace cartograph::extraction {

/**
 * @brief Lifecycle state of an external plugin process
 */
enum class ProcessState : uint8_t {
    Unstarted,    ///< Process not yet spawned
    Starting,     ///< Process spawn in progress
    Ready,        ///< Process ready to accept requests
    ShuttingDown, ///< Shutdown initiated
    Terminated,   ///< Process has exited
    Failed        ///< Process failed/crashed
};

/**
 * @brief Configuration for spawning external plugin processes
 *
 * @code
 * PluginProcessConfig config{.executable = "python3", .args = {"infer.py"}};
 * config.with_env("PYTHONUNBUFFERED", "1");
 * @endcode
 */
struct PluginProcessConfig {
    std::filesystem::path executable;                 ///< Resolved through PATH when relative
    std::vector<std::string> args;                    ///< Command-line arguments
    std::unordered_map<std::string, std::string> env; ///< Extra environment variables
    std::optional<std::filesystem::path> workdir;     ///< Working directory (optional)
    bool redirect_stderr{true};                       ///< Capture stderr for logging

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }
};

/**
 * @brief RAII wrapper for an external plugin process speaking line-oriented stdio.
 *
 * Reader threads pump the child's stdout into a line buffer and forward stderr to the
 * debug log. The child is terminated (SIGTERM, then SIGKILL) on destruction.
 * All public methods are thread-safe.
 */
class PluginProcess {
public:
    /**
     * @brief Construct and spawn plugin process
     * @throws std::runtime_error if pipes cannot be created or fork fails
     */
    explicit PluginProcess(PluginProcessConfig config);
    ~PluginProcess();

    PluginProcess(const PluginProcess&) = delete;
    PluginProcess& operator=(const PluginProcess&) = delete;
    PluginProcess(PluginProcess&&) noexcept;
    PluginProcess& operator=(PluginProcess&&) noexcept;

    [[nodiscard]] ProcessState state() const noexcept;
    [[nodiscard]] bool is_alive() const noexcept;

    /**
     * @brief Close stdin and stop the process, escalating to SIGKILL after `timeout`.
     */
    void terminate(std::chrono::milliseconds timeout = std::chrono::seconds{5});

    /**
     * @brief Write data to stdin (blocking)
     * @return Number of bytes written, or 0 on error
     */
    size_t write_stdin(std::span<const std::byte> data);

    /**
     * @brief Pop the next complete stdout line, waiting up to `timeout`.
     * @return The line without its terminator, or std::nullopt on timeout or EOF
     */
    [[nodiscard]] std::optional<std::string> read_line(std::chrono::milliseconds timeout);

    [[nodiscard]] int64_t pid() const noexcept;
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cartograph::extraction
