#include <bsplink/client/server_process.h>
#include <bsplink/core/format.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>

extern char** environ;

namespace bsplink::client {

namespace {

constexpr int kExecFailedStatus = 127;

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool is_executable_file(const std::filesystem::path& p) {
    struct stat st{};
    return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
}

// Everything the child needs, prepared before fork so the child only calls async-signal-safe
// functions.
struct ExecImage {
    std::string path;
    std::vector<std::string> argvStorage;
    std::vector<std::string> envStorage;
    std::vector<char*> argv;
    std::vector<char*> envp;

    void finalize() {
        for (auto& a : argvStorage)
            argv.push_back(a.data());
        argv.push_back(nullptr);
        for (auto& e : envStorage)
            envp.push_back(e.data());
        envp.push_back(nullptr);
    }
};

ExecImage build_image(const ServerProcessConfig& config, const std::filesystem::path& resolved) {
    ExecImage image;
    image.path = resolved.string();
    image.argvStorage.push_back(config.executable.string());
    for (const auto& arg : config.args) {
        image.argvStorage.push_back(arg);
    }

    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        if (config.env.count(std::string(key)) == 0) {
            image.envStorage.emplace_back(entry);
        }
    }
    for (const auto& [key, value] : config.env) {
        image.envStorage.push_back(key + "=" + value);
    }
    image.finalize();
    return image;
}

} // namespace

std::optional<std::filesystem::path> find_executable(const std::filesystem::path& program) {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.native().find('/') != std::string::npos) {
        return program;
    }
    const char* pathEnv = std::getenv("PATH");
    std::string search = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream ss(search);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = std::filesystem::path(dir) / program;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

ServerProcess::ServerProcess(ServerProcessConfig config)
    : config_(std::move(config)), startTime_(std::chrono::steady_clock::now()) {}

Result<std::unique_ptr<ServerProcess>> ServerProcess::spawn(ServerProcessConfig config) {
    auto resolved = find_executable(config.executable);
    if (!resolved) {
        return Error{ErrorCode::SpawnFailed,
                     bsplink::format("build server '{}' not found in PATH",
                                     config.executable.string())};
    }

    std::unique_ptr<ServerProcess> proc(new ServerProcess(std::move(config)));
    const auto& cfg = proc->config_;
    auto image = build_image(cfg, *resolved);

    // All parent-side descriptors are close-on-exec; the child dup2()s what it keeps.
    std::array<int, 2> errPipe{-1, -1};
    std::array<int, 2> outPipe{-1, -1};
    std::array<int, 2> inPipe{-1, -1};
    std::array<int, 2> chanOutPipe{-1, -1};
    auto cleanup = [&]() {
        for (auto* p : {&errPipe, &outPipe, &inPipe, &chanOutPipe}) {
            close_fd((*p)[0]);
            close_fd((*p)[1]);
        }
    };

    if (::pipe2(errPipe.data(), O_CLOEXEC) < 0 ||
        (cfg.captureOutput && ::pipe2(outPipe.data(), O_CLOEXEC) < 0) ||
        (cfg.stdioTransport &&
         (::pipe2(inPipe.data(), O_CLOEXEC) < 0 || ::pipe2(chanOutPipe.data(), O_CLOEXEC) < 0))) {
        int err = errno;
        cleanup();
        return Error{ErrorCode::SpawnFailed,
                     bsplink::format("failed to create pipes: {}", std::strerror(err))};
    }

    int devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    const char* workdir = cfg.workdir ? cfg.workdir->c_str() : nullptr;

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        cleanup();
        close_fd(devnull);
        return Error{ErrorCode::SpawnFailed, bsplink::format("fork failed: {}", std::strerror(err))};
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        if (cfg.newSession) {
            (void)::setsid();
        }
        int stdinFd = cfg.stdioTransport ? inPipe[0] : devnull;
        int stdoutFd = cfg.stdioTransport ? chanOutPipe[1]
                                          : (cfg.captureOutput ? outPipe[1] : devnull);
        int stderrFd = (cfg.stdioTransport && cfg.captureOutput) ? outPipe[1] : devnull;
        if (stdinFd >= 0)
            (void)::dup2(stdinFd, STDIN_FILENO);
        if (stdoutFd >= 0)
            (void)::dup2(stdoutFd, STDOUT_FILENO);
        if (stderrFd >= 0)
            (void)::dup2(stderrFd, STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);

        if (workdir && ::chdir(workdir) < 0) {
            int err = errno;
            (void)!::write(errPipe[1], &err, sizeof(err));
            ::_exit(kExecFailedStatus);
        }
        ::execve(image.path.c_str(), image.argv.data(), image.envp.data());
        int err = errno;
        (void)!::write(errPipe[1], &err, sizeof(err));
        ::_exit(kExecFailedStatus);
    }

    // Parent
    proc->pid_ = pid;
    close_fd(devnull);
    close_fd(errPipe[1]);
    close_fd(outPipe[1]);
    close_fd(inPipe[0]);
    close_fd(chanOutPipe[1]);

    int execErr = 0;
    ssize_t n;
    do {
        n = ::read(errPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    close_fd(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        // Child never ran the server; reap it and report why
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        proc->reap(status);
        close_fd(outPipe[0]);
        close_fd(inPipe[1]);
        close_fd(chanOutPipe[0]);
        return Error{ErrorCode::SpawnFailed,
                     bsplink::format("cannot execute '{}': {}", image.path,
                                     std::strerror(execErr))};
    }

    proc->outputFd_ = outPipe[0];
    proc->channelReadFd_ = chanOutPipe[0];
    proc->channelWriteFd_ = inPipe[1];
    spdlog::info("Spawned build server {} (pid={})", image.path, pid);
    return proc;
}

ServerProcess::~ServerProcess() {
    if (!detached() && is_alive()) {
        spdlog::debug("ServerProcess: terminating pid={} on handle destruction", pid_);
        terminate(std::chrono::seconds{2});
    } else if (detached()) {
        // Reap if it already exited; a detached server is otherwise left running
        (void)wait_for_exit(std::chrono::milliseconds(0));
    }
    if (outputThread_.joinable()) {
        outputThread_.request_stop();
        outputThread_.join();
    }
    close_fd(outputFd_);
    close_fd(channelReadFd_);
    close_fd(channelWriteFd_);
}

void ServerProcess::reap(int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    reaped_ = true;
    if (WIFEXITED(status)) {
        exitCode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitCode_ = 128 + WTERMSIG(status);
    }
}

bool ServerProcess::is_alive() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_ || pid_ <= 0) {
            return false;
        }
    }
    return !wait_for_exit(std::chrono::milliseconds(0));
}

std::optional<int> ServerProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exitCode_;
}

std::chrono::milliseconds ServerProcess::uptime() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 startTime_);
}

bool ServerProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reaped_) {
                return true;
            }
        }
        int status = 0;
        pid_t result = ::waitpid(static_cast<pid_t>(pid_), &status, WNOHANG);
        if (result > 0) {
            reap(status);
            return true;
        }
        if (result < 0 && errno == ECHILD) {
            // Reaped elsewhere
            std::lock_guard<std::mutex> lock(mutex_);
            reaped_ = true;
            return true;
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

void ServerProcess::terminate(std::chrono::milliseconds timeout) {
    if (!is_alive()) {
        return;
    }
    spdlog::info("Terminating build server (pid={})", pid_);

    // Closing the channel lets a stdio server see EOF first
    {
        std::lock_guard<std::mutex> lock(mutex_);
        close_fd(channelWriteFd_);
    }

    if (::kill(static_cast<pid_t>(pid_), SIGTERM) == 0 && wait_for_exit(timeout)) {
        return;
    }
    spdlog::warn("Build server pid={} ignored SIGTERM, killing", pid_);
    ::kill(static_cast<pid_t>(pid_), SIGKILL);
    (void)wait_for_exit(std::chrono::seconds{1});
}

void ServerProcess::start_output_reader(LineCallback onLine) {
    if (outputFd_ < 0 || outputThread_.joinable()) {
        return;
    }
    outputThread_ = std::jthread(
        [this, cb = std::move(onLine)](std::stop_token token) mutable {
            output_loop(token, std::move(cb));
        });
}

void ServerProcess::output_loop(std::stop_token token, LineCallback onLine) {
    std::string pending;
    std::array<char, 4096> buf{};
    while (!token.stop_requested()) {
        pollfd pfd{outputFd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (rc == 0) {
            continue;
        }
        ssize_t n = ::read(outputFd_, buf.data(), buf.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            break;
        }
        if (n == 0) {
            break;
        }
        pending.append(buf.data(), static_cast<size_t>(n));
        std::size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string_view line(pending.data(), pos);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if (onLine) {
                onLine(line);
            }
            pending.erase(0, pos + 1);
        }
    }
    if (!pending.empty() && onLine) {
        onLine(pending);
    }
    spdlog::debug("ServerProcess: output of pid={} closed", pid_);
}

std::pair<int, int> ServerProcess::take_stdio_channel() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::pair<int, int> fds{channelReadFd_, channelWriteFd_};
    channelReadFd_ = -1;
    channelWriteFd_ = -1;
    return fds;
}

} // namespace bsplink::client
