#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <bsplink/core/types.h>

namespace bsplink::client {

/**
 * @brief Configuration for spawning a build server process
 */
struct ServerProcessConfig {
    std::filesystem::path executable; ///< Absolute path or a name looked up in PATH
    std::vector<std::string> args;    ///< Command-line arguments (argv[1..])
    std::unordered_map<std::string, std::string> env; ///< Added to the inherited environment
    std::optional<std::filesystem::path> workdir;

    /// Child's stdin/stdout become the protocol channel (stdio endpoints)
    bool stdioTransport{false};
    /// Capture the output stream that carries the ready sentinel (stdout, or stderr in stdio mode)
    bool captureOutput{true};
    /// Start the child in its own session so it outlives the launching terminal
    bool newSession{true};

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }
};

/**
 * @brief RAII handle of a spawned build server
 *
 * The destructor terminates the child (SIGTERM, grace period, SIGKILL) unless detach() was
 * called, so a launcher failing after the spawn never leaks the process.
 *
 * Thread-safe.
 */
class ServerProcess {
public:
    using LineCallback = std::function<void(std::string_view line)>;

    /**
     * @brief Fork and exec the server
     *
     * Exec failures (missing binary, permission) are reported through a close-on-exec pipe and
     * surface as SpawnFailed.
     */
    static Result<std::unique_ptr<ServerProcess>> spawn(ServerProcessConfig config);

    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    [[nodiscard]] int64_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool is_alive();
    [[nodiscard]] std::optional<int> exit_code() const;
    [[nodiscard]] std::chrono::milliseconds uptime() const noexcept;

    /// Poll for exit with WNOHANG. Returns true once the child has been reaped.
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

    /// SIGTERM, wait up to @p timeout, then SIGKILL.
    void terminate(std::chrono::milliseconds timeout = std::chrono::seconds{5});

    /// Keep the server running when this handle is destroyed.
    void detach() noexcept { detached_.store(true, std::memory_order_release); }
    [[nodiscard]] bool detached() const noexcept {
        return detached_.load(std::memory_order_acquire);
    }

    /**
     * @brief Start a thread delivering captured output line by line
     *
     * Runs until end of stream or destruction of the handle. No-op without captureOutput.
     */
    void start_output_reader(LineCallback onLine);

    /// Descriptors of the stdio protocol channel (read from child stdout, write to child
    /// stdin). Ownership moves to the caller; both are -1 after the first call.
    std::pair<int, int> take_stdio_channel() noexcept;

    const ServerProcessConfig& config() const noexcept { return config_; }

private:
    explicit ServerProcess(ServerProcessConfig config);

    void reap(int status);
    void output_loop(std::stop_token token, LineCallback onLine);

    ServerProcessConfig config_;
    int64_t pid_{-1};
    std::chrono::steady_clock::time_point startTime_;
    std::atomic<bool> detached_{false};

    mutable std::mutex mutex_;
    std::optional<int> exitCode_;
    bool reaped_{false};

    int outputFd_{-1};
    int channelReadFd_{-1};
    int channelWriteFd_{-1};
    std::jthread outputThread_;
};

// Resolve a bare program name through PATH. Paths containing '/' are returned unchanged.
std::optional<std::filesystem::path> find_executable(const std::filesystem::path& program);

} // namespace bsplink::client
