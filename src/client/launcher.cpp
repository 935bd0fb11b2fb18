#include <bsplink/client/launcher.h>
#include <bsplink/config/config_helpers.h>
#include <bsplink/core/format.h>
#include <bsplink/ipc/json_rpc_peer.h>
#include <bsplink/ipc/transport_failure.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <sys/stat.h>
#include <unistd.h>

namespace bsplink::client {

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using Clock = std::chrono::steady_clock;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
// Bounds each step of asking a running server to exit
constexpr auto kRetireStepTimeout = std::chrono::milliseconds(5000);

awaitable<void> sleep_for(std::chrono::milliseconds delay) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(delay);
    boost::system::error_code ec;
    co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
}

// Only "nobody is listening" justifies starting a server
bool should_spawn_after(const Error& error) {
    return error.code == ErrorCode::ConnectionRefused || error.code == ErrorCode::Timeout;
}

bool is_socket(const ipc::TransportEndpoint& endpoint) {
    return std::holds_alternative<ipc::TcpEndpoint>(endpoint) ||
           std::holds_alternative<ipc::LocalSocketEndpoint>(endpoint);
}

Error exited_early(ServerProcess& process) {
    auto code = process.exit_code();
    return Error{ErrorCode::SpawnFailed,
                 bsplink::format("build server exited{} before becoming ready",
                                 code ? bsplink::format(" with status {}", *code) : "")};
}

} // namespace

const char* to_string(ReadinessStrategy strategy) noexcept {
    switch (strategy) {
        case ReadinessStrategy::Sentinel:
            return "sentinel";
        case ReadinessStrategy::Probe:
            return "probe";
    }
    return "sentinel";
}

std::optional<ReadinessStrategy> parse_readiness_strategy(std::string_view text) {
    if (text == "sentinel")
        return ReadinessStrategy::Sentinel;
    if (text == "probe")
        return ReadinessStrategy::Probe;
    return std::nullopt;
}

std::optional<ReadyAnnouncement> parse_ready_line(std::string_view line) {
    if (line.substr(0, ipc::kReadySentinel.size()) != ipc::kReadySentinel) {
        return std::nullopt;
    }
    line.remove_prefix(ipc::kReadySentinel.size());
    auto next_token = [&line]() -> std::string_view {
        auto start = line.find_first_not_of(" \t");
        if (start == std::string_view::npos) {
            line = {};
            return {};
        }
        line.remove_prefix(start);
        auto end = line.find_first_of(" \t");
        auto token = line.substr(0, end);
        line.remove_prefix(end == std::string_view::npos ? line.size() : end);
        return token;
    };
    auto endpoint = next_token();
    auto version = next_token();
    if (endpoint.empty() || version.empty()) {
        return std::nullopt;
    }
    return ReadyAnnouncement{std::string(endpoint), std::string(version)};
}

std::string format_ready_line(std::string_view endpoint, std::string_view version) {
    return bsplink::format("{} {} {}", ipc::kReadySentinel, endpoint, version);
}

Launcher::Launcher(LauncherOptions options) : options_(std::move(options)) {
    if (const char* noauto = std::getenv("BSPLINK_DISABLE_AUTOSTART");
        noauto && config::env_truthy(noauto)) {
        options_.autoStart = false;
    }
}

ipc::TransportEndpoint Launcher::server_side_endpoint(const ipc::TransportEndpoint& endpoint) {
    if (auto* pipe = std::get_if<ipc::PipeEndpoint>(&endpoint);
        pipe && !pipe->usesDescriptors()) {
        ipc::PipeEndpoint mirrored;
        mirrored.readPath = pipe->writePath;
        mirrored.writePath = pipe->readPath;
        return mirrored;
    }
    return endpoint;
}

std::vector<std::string> Launcher::server_arguments() const {
    std::vector<std::string> args;
    if (ipc::is_stdio(options_.endpoint)) {
        args = {"--stdio"};
    } else {
        args = {"--endpoint", ipc::to_string(server_side_endpoint(options_.endpoint))};
    }
    args.emplace_back("--protocol-version");
    args.push_back(options_.protocolVersion);
    args.insert(args.end(), options_.extraArgs.begin(), options_.extraArgs.end());
    return args;
}

awaitable<Result<LaunchResult>> Launcher::connect(bool restart) {
    const auto label = ipc::to_string(options_.endpoint);
    const bool stdio = ipc::is_stdio(options_.endpoint);

    if (!restart && !stdio) {
        auto existing = co_await ipc::open_connection(options_.endpoint, options_.transport);
        if (existing) {
            spdlog::debug("Connected to running build server at {}", label);
            LaunchResult result;
            result.connection = std::move(existing).value();
            co_return std::move(result);
        }
        if (!should_spawn_after(existing.error())) {
            co_return existing.error();
        }
        if (!options_.autoStart) {
            co_return existing.error();
        }
        spdlog::debug("No build server at {} ({}), starting one", label,
                      existing.error().message);
    } else if (!options_.autoStart) {
        co_return Error{ErrorCode::ConnectionRefused,
                        bsplink::format("cannot start a build server for {}: autostart disabled",
                                        label)};
    } else if (is_socket(options_.endpoint)) {
        // A server nobody tracks may still own the endpoint
        auto retired = co_await retire_running_server();
        if (!retired) {
            co_return retired.error();
        }
    }

    auto launched = co_await spawn_and_connect();
    co_return std::move(launched);
}

awaitable<Result<void>> Launcher::retire_running_server() {
    const auto label = ipc::to_string(options_.endpoint);
    auto existing = co_await ipc::open_connection(options_.endpoint, options_.transport);
    if (!existing) {
        if (should_spawn_after(existing.error())) {
            co_return Result<void>();
        }
        co_return existing.error();
    }

    spdlog::info("Asking the build server at {} to exit before restarting", label);
    auto peer = ipc::JsonRpcPeer::create(std::move(existing).value());
    peer->start();
    const auto stepTimeout = std::min(options_.transport.requestTimeout, kRetireStepTimeout);

    ipc::InitializeBuildParams params;
    params.displayName = "bsplink-launcher";
    params.version = "0.1.0";
    std::error_code ec;
    auto root = options_.workdir ? *options_.workdir : std::filesystem::current_path(ec);
    params.rootUri = ipc::path_to_uri(std::filesystem::absolute(root, ec));

    auto initialized = co_await peer->request(std::string(ipc::methods::kInitialize),
                                              ipc::json(params), stepTimeout);
    if (initialized) {
        auto stopped =
            co_await peer->request(std::string(ipc::methods::kShutdown), nullptr, stepTimeout);
        if (stopped) {
            if (auto sent = peer->notify(ipc::methods::kExit); !sent) {
                spdlog::debug("build/exit to {} not delivered: {}", label, sent.error().message);
            }
        } else {
            spdlog::warn("Build server at {} rejected build/shutdown: {}", label,
                         stopped.error().message);
        }
    } else {
        spdlog::warn("Build server at {} rejected build/initialize: {}", label,
                     initialized.error().message);
    }
    peer->close();

    const auto deadline = Clock::now() + options_.readinessTimeout;
    while (Clock::now() < deadline) {
        auto probe = co_await ipc::open_connection(options_.endpoint, options_.transport);
        if (!probe) {
            if (should_spawn_after(probe.error())) {
                spdlog::debug("Build server at {} is gone", label);
                co_return Result<void>();
            }
            co_return probe.error();
        }
        probe.value()->close();
        co_await sleep_for(5 * kPollInterval);
    }
    co_return Error{ErrorCode::InvalidState,
                    bsplink::format("build server at {} is still running after build/shutdown "
                                    "(other clients connected?); not starting another",
                                    label)};
}

Result<void> Launcher::prepare_fifos() const {
    auto* pipe = std::get_if<ipc::PipeEndpoint>(&options_.endpoint);
    if (!pipe || pipe->usesDescriptors()) {
        return Result<void>();
    }
    for (const auto& path : {pipe->readPath, pipe->writePath}) {
        if (::mkfifo(path.c_str(), 0600) < 0 && errno != EEXIST) {
            int err = errno;
            return Error{ErrorCode::SpawnFailed,
                         bsplink::format("mkfifo {}: {}", path.string(), std::strerror(err))};
        }
    }
    return Result<void>();
}

awaitable<Result<LaunchResult>> Launcher::spawn_and_connect() {
    const bool stdio = ipc::is_stdio(options_.endpoint);
    const bool sentinel = options_.readiness == ReadinessStrategy::Sentinel;

    if (auto fifos = prepare_fifos(); !fifos) {
        co_return fifos.error();
    }
    if (auto* local = std::get_if<ipc::LocalSocketEndpoint>(&options_.endpoint)) {
        std::error_code ec;
        std::filesystem::create_directories(local->path.parent_path(), ec);
    }

    ServerProcessConfig config;
    config.executable = options_.serverBinary;
    config.args = server_arguments();
    config.env = options_.env;
    config.workdir = options_.workdir;
    config.stdioTransport = stdio;
    config.captureOutput = true;
    // A stdio server lives and dies with this client
    config.newSession = !stdio;

    spdlog::info("Starting build server {} for {}", options_.serverBinary.string(),
                 ipc::to_string(options_.endpoint));
    auto spawned = ServerProcess::spawn(std::move(config));
    if (!spawned) {
        co_return spawned.error();
    }
    // From here on every early return destroys the handle, which terminates the child
    std::unique_ptr<ServerProcess> process = std::move(spawned).value();

    auto signal = std::make_shared<ReadinessSignal>();
    const auto pid = process->pid();
    process->start_output_reader([signal, pid](std::string_view line) {
        if (auto announcement = parse_ready_line(line)) {
            if (signal->resolve(std::move(*announcement))) {
                return;
            }
        }
        spdlog::debug("[bsplink-server:{}] {}", pid, line);
    });

    std::shared_ptr<ipc::Connection> connection;
    if (sentinel) {
        auto ready = co_await wait_for_sentinel(*process, signal);
        if (!ready) {
            co_return ready.error();
        }
        auto opened = co_await open_channel(*process);
        if (!opened) {
            co_return opened.error();
        }
        connection = std::move(opened).value();
    } else if (stdio) {
        // The channel exists as soon as the child does
        auto opened = co_await open_channel(*process);
        if (!opened) {
            co_return opened.error();
        }
        connection = std::move(opened).value();
    } else {
        auto probed = co_await probe_until_ready(*process);
        if (!probed) {
            co_return probed.error();
        }
        connection = std::move(probed).value();
    }

    if (!stdio) {
        process->detach();
    }
    spdlog::info("Build server ready at {} (pid={})", connection->describe(), pid);

    LaunchResult result;
    result.connection = std::move(connection);
    result.process = std::move(process);
    result.spawned = true;
    co_return std::move(result);
}

awaitable<Result<void>> Launcher::wait_for_sentinel(ServerProcess& process,
                                                    std::shared_ptr<ReadinessSignal> signal) {
    const auto deadline = Clock::now() + options_.readinessTimeout;
    while (!signal->ready()) {
        if (!process.is_alive()) {
            // The ready line may have been the last thing the child wrote
            if (signal->ready()) {
                break;
            }
            co_return exited_early(process);
        }
        if (Clock::now() >= deadline) {
            co_return Error{ErrorCode::ReadinessTimeout,
                            bsplink::format("build server did not announce readiness within {}ms",
                                            options_.readinessTimeout.count())};
        }
        co_await sleep_for(kPollInterval);
    }

    auto announcement = signal->wait_for(std::chrono::milliseconds(0));
    if (!announcement) {
        co_return Error{ErrorCode::InternalError, "readiness signal lost"};
    }
    if (announcement->version != options_.protocolVersion) {
        co_return Error{ErrorCode::VersionMismatch,
                        bsplink::format("build server speaks '{}', expected '{}'",
                                        announcement->version, options_.protocolVersion)};
    }
    spdlog::debug("Build server announced {} ({})", announcement->endpoint,
                  announcement->version);
    co_return Result<void>();
}

awaitable<Result<std::shared_ptr<ipc::Connection>>>
Launcher::probe_until_ready(ServerProcess& process) {
    const auto deadline = Clock::now() + options_.readinessTimeout;
    auto delay = options_.probeBaseDelay;
    Error last{ErrorCode::ReadinessTimeout, "no connection attempt made"};
    int attempt = 0;
    while (Clock::now() < deadline) {
        auto connection = co_await ipc::open_connection(options_.endpoint, options_.transport);
        ++attempt;
        if (connection) {
            spdlog::debug("Build server accepted after {} probe(s)", attempt);
            co_return std::move(connection).value();
        }
        last = connection.error();
        if (!should_spawn_after(last)) {
            co_return last;
        }
        if (!process.is_alive()) {
            co_return exited_early(process);
        }
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        co_await sleep_for(std::max(std::chrono::milliseconds(1), std::min(delay, remaining)));
        delay = std::min(delay * 2, options_.probeMaxDelay);
    }
    co_return Error{ErrorCode::ReadinessTimeout,
                    bsplink::format("build server not reachable within {}ms (last: {})",
                                    options_.readinessTimeout.count(), last.message)};
}

awaitable<Result<std::shared_ptr<ipc::Connection>>> Launcher::open_channel(ServerProcess& process) {
    if (!ipc::is_stdio(options_.endpoint)) {
        auto connection = co_await ipc::open_connection(options_.endpoint, options_.transport);
        co_return connection;
    }
    auto [readFd, writeFd] = process.take_stdio_channel();
    if (readFd < 0 || writeFd < 0) {
        co_return Error{ErrorCode::InternalError, "stdio channel of the server is not available"};
    }
    ipc::PipeEndpoint channel;
    channel.readFd = readFd;
    channel.writeFd = writeFd;
    // open_connection duplicates the descriptors
    auto connection = co_await ipc::open_connection(channel, options_.transport);
    ::close(readFd);
    ::close(writeFd);
    co_return connection;
}

} // namespace bsplink::client
