#include <cartograph/extraction/plugin_process.h>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cartograph::extraction {

namespace {

constexpr int kPollIntervalMs = 50;

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

class PluginProcess::Impl {
public:
    explicit Impl(PluginProcessConfig config);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    [[nodiscard]] ProcessState state() const noexcept;
    [[nodiscard]] bool is_alive() const noexcept;
    void terminate(std::chrono::milliseconds timeout);
    size_t write_stdin(std::span<const std::byte> data);
    [[nodiscard]] std::optional<std::string> read_line(std::chrono::milliseconds timeout);
    [[nodiscard]] int64_t pid() const noexcept { return static_cast<int64_t>(process_id_); }
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

private:
    void spawn_process();
    void start_io_threads();
    void stop_io_threads();
    void read_stdout_loop(std::stop_token stop);
    void read_stderr_loop(std::stop_token stop);

    PluginProcessConfig config_;
    std::atomic<ProcessState> state_{ProcessState::Unstarted};
    mutable std::mutex exit_mutex_;
    std::optional<int> exit_code_;

    // Complete stdout lines plus the unterminated tail
    std::deque<std::string> lines_;
    std::string partial_;
    bool stdout_eof_{false};
    std::mutex stdout_mutex_;
    std::condition_variable stdout_cv_;
    std::mutex stdin_mutex_;

    std::jthread stdout_thread_;
    std::jthread stderr_thread_;

    pid_t process_id_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
};

PluginProcess::Impl::Impl(PluginProcessConfig config) : config_{std::move(config)} {
    // A plugin dying mid-write must not take the host down
    signal(SIGPIPE, SIG_IGN);

    state_.store(ProcessState::Starting, std::memory_order_release);
    try {
        spawn_process();
        start_io_threads();
        state_.store(ProcessState::Ready, std::memory_order_release);
    } catch (const std::exception&) {
        state_.store(ProcessState::Failed, std::memory_order_release);
        closeFd(stdin_fd_);
        closeFd(stdout_fd_);
        closeFd(stderr_fd_);
        throw;
    }
}

PluginProcess::Impl::~Impl() {
    if (is_alive()) {
        terminate(std::chrono::seconds{5});
    }
    stop_io_threads();
    closeFd(stdin_fd_);
    closeFd(stdout_fd_);
    closeFd(stderr_fd_);
}

void PluginProcess::Impl::spawn_process() {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe(stdin_pipe) < 0 || pipe(stdout_pipe) < 0 || pipe(stderr_pipe) < 0) {
        std::string err = strerror(errno);
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                       stderr_pipe[0], stderr_pipe[1]}) {
            if (fd >= 0)
                close(fd);
        }
        throw std::runtime_error("Failed to create pipes: " + err);
    }

    // Prepare argv before fork so the child only calls async-signal-safe functions
    std::string exe_str = config_.executable.string();
    std::vector<char*> argv;
    argv.push_back(exe_str.data());
    for (auto& arg : config_.args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::string err = strerror(errno);
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                       stderr_pipe[0], stderr_pipe[1]}) {
            close(fd);
        }
        throw std::runtime_error("fork() failed: " + err);
    }

    if (pid == 0) {
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        if (config_.redirect_stderr) {
            dup2(stderr_pipe[1], STDERR_FILENO);
        }
        for (int fd : {stdin_pipe[0], stdin_pipe[1], stdout_pipe[0], stdout_pipe[1],
                       stderr_pipe[0], stderr_pipe[1]}) {
            close(fd);
        }
        if (config_.workdir && chdir(config_.workdir->c_str()) < 0) {
            _exit(127);
        }
        for (const auto& [key, value] : config_.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    process_id_ = pid;
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    fcntl(stdout_fd_, F_SETFL, O_NONBLOCK);
    fcntl(stderr_fd_, F_SETFL, O_NONBLOCK);

    spdlog::info("PluginProcess: spawned {} (pid={})", exe_str, process_id_);
}

void PluginProcess::Impl::start_io_threads() {
    stdout_thread_ = std::jthread{[this](std::stop_token stop) { read_stdout_loop(stop); }};
    if (config_.redirect_stderr) {
        stderr_thread_ = std::jthread{[this](std::stop_token stop) { read_stderr_loop(stop); }};
    }
}

void PluginProcess::Impl::stop_io_threads() {
    stdout_thread_.request_stop();
    stderr_thread_.request_stop();
    if (stdout_thread_.joinable())
        stdout_thread_.join();
    if (stderr_thread_.joinable())
        stderr_thread_.join();
}

void PluginProcess::Impl::read_stdout_loop(std::stop_token stop) {
    std::array<char, 4096> buffer;
    pollfd pfd{stdout_fd_, POLLIN, 0};

    while (!stop.stop_requested()) {
        int ready = poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0 && errno != EINTR)
            break;
        if (ready <= 0)
            continue;

        ssize_t n = read(stdout_fd_, buffer.data(), buffer.size());
        if (n > 0) {
            std::lock_guard lock{stdout_mutex_};
            partial_.append(buffer.data(), static_cast<size_t>(n));
            size_t pos;
            while ((pos = partial_.find('\n')) != std::string::npos) {
                lines_.push_back(partial_.substr(0, pos));
                partial_.erase(0, pos + 1);
            }
            stdout_cv_.notify_all();
        } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
            break;
        }
    }

    std::lock_guard lock{stdout_mutex_};
    stdout_eof_ = true;
    stdout_cv_.notify_all();
}

void PluginProcess::Impl::read_stderr_loop(std::stop_token stop) {
    std::array<char, 4096> buffer;
    pollfd pfd{stderr_fd_, POLLIN, 0};

    while (!stop.stop_requested()) {
        int ready = poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0 && errno != EINTR)
            break;
        if (ready <= 0)
            continue;

        ssize_t n = read(stderr_fd_, buffer.data(), buffer.size());
        if (n > 0) {
            spdlog::debug("Plugin stderr: {}",
                          std::string_view(buffer.data(), static_cast<size_t>(n)));
        } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
            break;
        }
    }
}

ProcessState PluginProcess::Impl::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

bool PluginProcess::Impl::is_alive() const noexcept {
    auto current = state();
    if (current != ProcessState::Starting && current != ProcessState::Ready) {
        return false;
    }
    if (process_id_ > 0 && kill(process_id_, 0) == -1 && errno == ESRCH) {
        return false;
    }
    return true;
}

void PluginProcess::Impl::terminate(std::chrono::milliseconds timeout) {
    if (!is_alive() || process_id_ <= 0) {
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return;
    }

    spdlog::info("PluginProcess: terminating {} (pid={})", config_.executable.string(),
                 process_id_);
    state_.store(ProcessState::ShuttingDown, std::memory_order_release);

    // EOF on stdin lets well-behaved plugins exit on their own
    {
        std::lock_guard lock{stdin_mutex_};
        closeFd(stdin_fd_);
    }

    if (kill(process_id_, SIGTERM) == 0 && wait_for_exit(timeout)) {
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return;
    }

    spdlog::warn("PluginProcess: forcefully killing pid {}", process_id_);
    kill(process_id_, SIGKILL);
    if (!wait_for_exit(std::chrono::seconds{1})) {
        spdlog::warn("PluginProcess: pid {} did not exit after SIGKILL", process_id_);
    }
    state_.store(ProcessState::Terminated, std::memory_order_release);
}

bool PluginProcess::Impl::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        pid_t result = waitpid(process_id_, &status, WNOHANG);
        if (result > 0) {
            std::lock_guard lock{exit_mutex_};
            if (WIFEXITED(status)) {
                exit_code_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code_ = 128 + WTERMSIG(status);
            }
            return true;
        }
        if (result < 0 && errno == ECHILD) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return false;
}

size_t PluginProcess::Impl::write_stdin(std::span<const std::byte> data) {
    std::lock_guard lock{stdin_mutex_};
    if (stdin_fd_ < 0 || !is_alive()) {
        return 0;
    }

    size_t total = 0;
    while (total < data.size()) {
        ssize_t written = write(stdin_fd_, data.data() + total, data.size() - total);
        if (written < 0) {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE) {
                spdlog::error("PluginProcess: broken pipe, plugin terminated");
                state_.store(ProcessState::Terminated, std::memory_order_release);
            } else {
                spdlog::error("PluginProcess: write to stdin failed: {}", strerror(errno));
            }
            return total;
        }
        total += static_cast<size_t>(written);
    }
    return total;
}

std::optional<std::string> PluginProcess::Impl::read_line(std::chrono::milliseconds timeout) {
    std::unique_lock lock{stdout_mutex_};
    stdout_cv_.wait_for(lock, timeout, [&] { return !lines_.empty() || stdout_eof_; });
    if (lines_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

std::optional<int> PluginProcess::Impl::exit_code() const noexcept {
    std::lock_guard lock{exit_mutex_};
    return exit_code_;
}

// PluginProcess forwards to Impl

PluginProcess::PluginProcess(PluginProcessConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))} {}

PluginProcess::~PluginProcess() = default;

PluginProcess::PluginProcess(PluginProcess&&) noexcept = default;
PluginProcess& PluginProcess::operator=(PluginProcess&&) noexcept = default;

ProcessState PluginProcess::state() const noexcept {
    return impl_->state();
}

bool PluginProcess::is_alive() const noexcept {
    return impl_->is_alive();
}

void PluginProcess::terminate(std::chrono::milliseconds timeout) {
    impl_->terminate(timeout);
}

size_t PluginProcess::write_stdin(std::span<const std::byte> data) {
    return impl_->write_stdin(data);
}

std::optional<std::string> PluginProcess::read_line(std::chrono::milliseconds timeout) {
    return impl_->read_line(timeout);
}

int64_t PluginProcess::pid() const noexcept {
    return impl_->pid();
}

bool PluginProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    return impl_->wait_for_exit(timeout);
}

std::optional<int> PluginProcess::exit_code() const noexcept {
    return impl_->exit_code();
}

} // namespace cartograph::extraction
