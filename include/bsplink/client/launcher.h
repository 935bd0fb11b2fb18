#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include <bsplink/client/server_process.h>
#include <bsplink/core/types.h>
#include <bsplink/ipc/bsp_protocol.h>
#include <bsplink/ipc/connection.h>
#include <bsplink/ipc/endpoint.h>
#include <bsplink/ipc/transport_options.h>

namespace bsplink::client {

// How a freshly spawned server is detected as ready.
enum class ReadinessStrategy {
    Sentinel, // wait for the ready line on the server's output
    Probe     // poll the endpoint with exponential backoff
};

const char* to_string(ReadinessStrategy strategy) noexcept;
std::optional<ReadinessStrategy> parse_readiness_strategy(std::string_view text);

// Parsed "BSPLINK_SERVER_READY <endpoint> <version>" line.
struct ReadyAnnouncement {
    std::string endpoint;
    std::string version;
};

std::optional<ReadyAnnouncement> parse_ready_line(std::string_view line);
std::string format_ready_line(std::string_view endpoint, std::string_view version);

// One-shot readiness notification set by the output reader thread and awaited by the
// launcher. Only the first resolution counts.
class ReadinessSignal {
public:
    ReadinessSignal() : future_(promise_.get_future().share()) {}

    bool resolve(ReadyAnnouncement announcement) {
        if (resolved_.exchange(true)) {
            return false;
        }
        promise_.set_value(std::move(announcement));
        return true;
    }

    bool ready() const {
        return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    // Blocks up to timeout; empty when not resolved in time.
    std::optional<ReadyAnnouncement> wait_for(std::chrono::milliseconds timeout) const {
        if (future_.wait_for(timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return future_.get();
    }

private:
    std::promise<ReadyAnnouncement> promise_;
    std::shared_future<ReadyAnnouncement> future_;
    std::atomic<bool> resolved_{false};
};

struct LauncherOptions {
    ipc::TransportEndpoint endpoint;
    std::filesystem::path serverBinary{"bsplink-server"};
    std::vector<std::string> extraArgs;
    std::string protocolVersion{ipc::kServerProtocolToken};
    ReadinessStrategy readiness{ReadinessStrategy::Sentinel};
    std::chrono::milliseconds readinessTimeout{30000};
    std::chrono::milliseconds probeBaseDelay{50};
    std::chrono::milliseconds probeMaxDelay{1000};
    bool autoStart{true};
    ipc::TransportOptions transport;
    std::unordered_map<std::string, std::string> env;
    std::optional<std::filesystem::path> workdir;
};

struct LaunchResult {
    std::shared_ptr<ipc::Connection> connection;
    // Set when this launch spawned the server. Detached for socket and FIFO endpoints, owned
    // (and required alive) for stdio endpoints.
    std::unique_ptr<ServerProcess> process;
    bool spawned{false};
};

/**
 * Connects to a build server, starting one when nothing answers on the endpoint.
 *
 * connect(false) tries the endpoint first and only spawns on refusal. connect(true) always
 * spawns; on a socket endpoint a server that still answers is first asked to exit
 * (build/initialize, build/shutdown, build/exit), and the restart fails with InvalidState when
 * it keeps accepting connections. A spawned server gets
 *   <serverBinary> --endpoint <spec> --protocol-version <token> [extraArgs]
 * and is terminated again on every failure path.
 *
 * BSPLINK_DISABLE_AUTOSTART=1 disables spawning.
 */
class Launcher {
public:
    explicit Launcher(LauncherOptions options);

    boost::asio::awaitable<Result<LaunchResult>> connect(bool restart = false);

    // argv (without argv[0]) for the server binary
    std::vector<std::string> server_arguments() const;

    // Endpoint as seen by the server (FIFO directions swapped)
    static ipc::TransportEndpoint server_side_endpoint(const ipc::TransportEndpoint& endpoint);

    const LauncherOptions& options() const noexcept { return options_; }

private:
    boost::asio::awaitable<Result<LaunchResult>> spawn_and_connect();
    boost::asio::awaitable<Result<void>> retire_running_server();
    boost::asio::awaitable<Result<void>> wait_for_sentinel(ServerProcess& process,
                                                           std::shared_ptr<ReadinessSignal> signal);
    boost::asio::awaitable<Result<std::shared_ptr<ipc::Connection>>>
    probe_until_ready(ServerProcess& process);
    boost::asio::awaitable<Result<std::shared_ptr<ipc::Connection>>>
    open_channel(ServerProcess& process);
    Result<void> prepare_fifos() const;

    LauncherOptions options_;
};

} // namespace bsplink::client
