#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/signal_set.hpp>

#include <bsplink/core/types.h>
#include <bsplink/ipc/duplex_stream.h>
#include <bsplink/ipc/endpoint.h>
#include <bsplink/ipc/thread_pool.h>
#include <bsplink/ipc/transport_options.h>
#include <bsplink/server/build_server_session.h>
#include <bsplink/server/compile_engine.h>
#include <bsplink/server/workspace.h>

namespace bsplink::server {

struct ServerConfig {
    ipc::TransportEndpoint endpoint;
    std::filesystem::path workspace;
    std::string protocolVersion{ipc::kServerProtocolToken};
    // Queries and lifecycle requests of every session
    std::size_t workerThreads{4};
    // buildTarget/compile requests; each compile holds one of these until it finishes
    std::size_t compileThreads{2};
    std::size_t ioThreads{1};
    ipc::TransportOptions transport;
    // Stop after this long without any session; 0 keeps serving
    std::chrono::milliseconds idleShutdown{0};
    // Stop on SIGINT/SIGTERM
    bool handleSignals{false};
    // Stop once a session ends with build/shutdown + build/exit and no other initialized
    // session remains
    bool exitAfterShutdown{false};
    ServerSessionOptions session;
};

/**
 * Accepts clients on the configured endpoint and binds a BuildServerSession to each.
 *
 * - tcp and local sockets: one session per accepted connection. An existing socket file is
 *   only replaced when nothing accepts on it (a live server makes start() fail with
 *   InvalidState); the file is removed again on stop().
 * - FIFO pairs: one session at a time; the pair is reopened after a session ends.
 * - stdio: a single session over fds 0/1; the server stops when it ends.
 *
 * wait() blocks until a stop is requested (signal, idle timeout, end of the stdio session or
 * request_stop()); stop() then tears everything down.
 */
class SocketServer {
public:
    SocketServer(ServerConfig config, std::shared_ptr<Workspace> workspace,
                 std::shared_ptr<ICompileEngine> engine);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    Result<void> start();
    Result<void> stop();
    bool isRunning() const { return running_.load(); }

    void wait();
    void request_stop();

    // Endpoint actually served, in text form (ephemeral tcp ports resolved)
    std::string endpoint() const;

    std::size_t activeSessions() const;
    uint64_t totalSessions() const { return totalSessions_.load(); }
    // Whether the most recent session ended after build/shutdown
    bool lastSessionClean() const { return lastSessionClean_.load(); }

private:
    using tcp = boost::asio::ip::tcp;
    using local = boost::asio::local::stream_protocol;

    Result<void> listen_tcp(const ipc::TcpEndpoint& endpoint);
    Result<void> listen_local(const ipc::LocalSocketEndpoint& endpoint);
    Result<void> serve_pipe(const ipc::PipeEndpoint& endpoint);
    void fifo_loop(std::stop_token token, ipc::PipeEndpoint endpoint, int readFd);

    template <typename Acceptor> boost::asio::awaitable<void> accept_loop(Acceptor& acceptor);
    boost::asio::awaitable<void> idle_watchdog();

    uint64_t attach(std::unique_ptr<ipc::IDuplexStream> stream);
    void on_session_closed(uint64_t id, bool clean);

    ServerConfig config_;
    std::shared_ptr<Workspace> workspace_;
    std::shared_ptr<ICompileEngine> engine_;
    std::shared_ptr<ipc::ThreadPool> workers_;
    std::shared_ptr<ipc::ThreadPool> compiles_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::vector<std::thread> io_threads_;
    std::unique_ptr<tcp::acceptor> tcpAcceptor_;
    std::unique_ptr<local::acceptor> localAcceptor_;
    std::unique_ptr<boost::asio::signal_set> signals_;
    std::jthread fifoThread_;
    std::filesystem::path socketPath_;
    std::string boundEndpoint_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    // Descriptor endpoints (stdio, fd://) serve exactly one session
    std::atomic<bool> singleSession_{false};
    std::atomic<uint64_t> totalSessions_{0};
    std::atomic<bool> lastSessionClean_{false};
    std::atomic<int64_t> lastActivityMs_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<uint64_t, std::shared_ptr<BuildServerSession>> sessions_;
    uint64_t nextSessionId_{1};
};

} // namespace bsplink::server
