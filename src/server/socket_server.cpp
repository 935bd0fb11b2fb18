#include <bsplink/core/format.h>
#include <bsplink/ipc/connection.h>
#include <bsplink/ipc/transport_failure.h>
#include <bsplink/server/socket_server.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/un.h>

namespace bsplink::server {

using boost::asio::awaitable;
using boost::asio::use_awaitable;

namespace {

int64_t steady_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

Error errno_error(std::string_view what, int err) {
    return Error{ErrorCode::NetworkError, bsplink::format("{}: {}", what, std::strerror(err))};
}

} // namespace

SocketServer::SocketServer(ServerConfig config, std::shared_ptr<Workspace> workspace,
                           std::shared_ptr<ICompileEngine> engine)
    : config_(std::move(config)), workspace_(std::move(workspace)), engine_(std::move(engine)) {}

SocketServer::~SocketServer() {
    stop();
}

Result<void> SocketServer::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Build server already running"};
    }
    stopRequested_.store(false);

    if (config_.workerThreads == 0) {
        config_.workerThreads = 1;
        spdlog::warn("SocketServer: workerThreads was 0; coercing to 1");
    }
    workers_ = std::make_shared<ipc::ThreadPool>("requests", config_.workerThreads);
    compiles_ = std::make_shared<ipc::ThreadPool>("compiles", config_.compileThreads);

    io_context_.restart();
    work_guard_.emplace(io_context_.get_executor());

    Result<void> listening;
    if (auto* tcpEndpoint = std::get_if<ipc::TcpEndpoint>(&config_.endpoint)) {
        listening = listen_tcp(*tcpEndpoint);
    } else if (auto* localEndpoint = std::get_if<ipc::LocalSocketEndpoint>(&config_.endpoint)) {
        listening = listen_local(*localEndpoint);
    } else {
        listening = serve_pipe(std::get<ipc::PipeEndpoint>(config_.endpoint));
    }
    if (!listening) {
        work_guard_.reset();
        workers_.reset();
        compiles_.reset();
        running_ = false;
        return listening.error();
    }

    if (config_.handleSignals) {
        signals_ = std::make_unique<boost::asio::signal_set>(io_context_, SIGINT, SIGTERM);
        signals_->async_wait([this](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                spdlog::info("Received signal {}; stopping build server", signo);
                request_stop();
            }
        });
    }

    lastActivityMs_.store(steady_millis());
    if (config_.idleShutdown.count() > 0) {
        boost::asio::co_spawn(io_context_, idle_watchdog(), boost::asio::detached);
    }

    const auto threads = std::max<std::size_t>(1, config_.ioThreads);
    io_threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        io_threads_.emplace_back([this, i] {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                spdlog::error("SocketServer: io thread {} exception: {}", i, e.what());
            }
        });
    }

    spdlog::info("Build server listening on {} (workers={}, compiles={})", boundEndpoint_,
                 config_.workerThreads, compiles_->size());
    return Result<void>();
}

Result<void> SocketServer::listen_tcp(const ipc::TcpEndpoint& endpoint) {
    boost::system::error_code ec;
    tcp::resolver resolver(io_context_);
    auto host = endpoint.host.empty() ? std::string("127.0.0.1") : endpoint.host;
    auto results = resolver.resolve(host, std::to_string(endpoint.port), ec);
    if (ec || results.empty()) {
        return Error{ErrorCode::MalformedAddress,
                     bsplink::format("cannot resolve '{}': {}", host, ec.message())};
    }
    auto bindTo = results.begin()->endpoint();

    tcpAcceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    tcpAcceptor_->open(bindTo.protocol(), ec);
    if (!ec) {
        tcpAcceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        tcpAcceptor_->bind(bindTo, ec);
    }
    if (!ec) {
        tcpAcceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        tcpAcceptor_.reset();
        return ipc::transportError(ec, bsplink::format("listen on {}:{}", host, endpoint.port));
    }

    // Port 0 binds an ephemeral port; report the real one
    auto bound = tcpAcceptor_->local_endpoint(ec);
    ipc::TcpEndpoint actual{host, ec ? endpoint.port : bound.port()};
    boundEndpoint_ = ipc::to_string(ipc::TransportEndpoint{actual});

    boost::asio::co_spawn(
        io_context_, [this]() -> awaitable<void> { co_await accept_loop(*tcpAcceptor_); },
        boost::asio::detached);
    return Result<void>();
}

Result<void> SocketServer::listen_local(const ipc::LocalSocketEndpoint& endpoint) {
    std::error_code fsEc;
    auto sockPath = std::filesystem::absolute(endpoint.path, fsEc);
    if (fsEc) {
        sockPath = endpoint.path;
    }

    auto sp = sockPath.string();
    if (sp.size() >= sizeof(sockaddr_un::sun_path)) {
        return Error{ErrorCode::MalformedAddress,
                     bsplink::format("Socket path too long for AF_UNIX ({}/{}) : '{}'", sp.size(),
                                     sizeof(sockaddr_un::sun_path), sp)};
    }

    if (std::filesystem::exists(sockPath, fsEc)) {
        local::socket live(io_context_);
        boost::system::error_code probeEc;
        live.connect(local::endpoint(sp), probeEc);
        if (!probeEc) {
            return Error{ErrorCode::InvalidState,
                         bsplink::format("a build server is already listening on {}", sp)};
        }
        spdlog::debug("Replacing stale socket {} ({})", sp, probeEc.message());
    }
    std::filesystem::remove(sockPath, fsEc);
    if (fsEc && fsEc != std::errc::no_such_file_or_directory) {
        spdlog::warn("Failed to remove existing socket: {}", fsEc.message());
    }
    auto parent = sockPath.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, fsEc);
        if (fsEc) {
            return Error{ErrorCode::PermissionDenied,
                         bsplink::format("cannot create '{}': {}", parent.string(),
                                         fsEc.message())};
        }
    }

    boost::system::error_code ec;
    local::endpoint bindTo(sp);
    localAcceptor_ = std::make_unique<local::acceptor>(io_context_);
    localAcceptor_->open(bindTo.protocol(), ec);
    if (!ec) {
        localAcceptor_->bind(bindTo, ec);
    }
    if (!ec) {
        localAcceptor_->listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        localAcceptor_.reset();
        return ipc::transportError(ec, bsplink::format("listen on {}", sp));
    }

    std::filesystem::permissions(sockPath,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 fsEc);
    socketPath_ = sockPath;
    boundEndpoint_ = ipc::to_string(ipc::TransportEndpoint{ipc::LocalSocketEndpoint{sockPath}});

    boost::asio::co_spawn(
        io_context_, [this]() -> awaitable<void> { co_await accept_loop(*localAcceptor_); },
        boost::asio::detached);
    return Result<void>();
}

Result<void> SocketServer::serve_pipe(const ipc::PipeEndpoint& endpoint) {
    boundEndpoint_ = ipc::to_string(ipc::TransportEndpoint{endpoint});

    if (endpoint.usesDescriptors()) {
        int r = ::fcntl(endpoint.readFd, F_DUPFD_CLOEXEC, 0);
        if (r < 0) {
            return errno_error("dup(read)", errno);
        }
        int w = ::fcntl(endpoint.writeFd, F_DUPFD_CLOEXEC, 0);
        if (w < 0) {
            int err = errno;
            ::close(r);
            return errno_error("dup(write)", err);
        }
        if (endpoint.isStdio()) {
            // Keep the protocol channel exclusive: stray stdout writes land on stderr
            ::dup2(STDERR_FILENO, STDOUT_FILENO);
        }
        singleSession_ = true;
        attach(ipc::PipeStream::adopt(io_context_.get_executor(), r, w, boundEndpoint_));
        return Result<void>();
    }

    // The read side is opened before readiness is announced so the client's non-blocking
    // open of its write side succeeds.
    int r = ::open(endpoint.readPath.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (r < 0) {
        int err = errno;
        return errno_error(bsplink::format("open '{}'", endpoint.readPath.string()), err);
    }
    fifoThread_ = std::jthread(
        [this, endpoint, r](std::stop_token token) { fifo_loop(token, endpoint, r); });
    return Result<void>();
}

void SocketServer::fifo_loop(std::stop_token token, ipc::PipeEndpoint endpoint, int readFd) {
    int r = readFd;
    while (!token.stop_requested()) {
        if (r < 0) {
            r = ::open(endpoint.readPath.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
            if (r < 0) {
                spdlog::error("Cannot reopen '{}': {}", endpoint.readPath.string(),
                              std::strerror(errno));
                request_stop();
                return;
            }
        }

        // A client is present once its first frame arrives
        bool readable = false;
        while (!token.stop_requested()) {
            pollfd pfd{r, POLLIN, 0};
            int n = ::poll(&pfd, 1, 100);
            if (n > 0) {
                readable = true;
                break;
            }
            if (n < 0 && errno != EINTR) {
                spdlog::warn("poll on '{}' failed: {}", endpoint.readPath.string(),
                             std::strerror(errno));
                break;
            }
        }
        if (!readable) {
            ::close(r);
            r = -1;
            continue;
        }

        int w = -1;
        const auto deadline = std::chrono::steady_clock::now() + config_.transport.connectTimeout;
        while (!token.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            w = ::open(endpoint.writePath.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
            if (w >= 0 || errno != ENXIO) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (w < 0) {
            spdlog::warn("Client never opened '{}'; discarding its request",
                         endpoint.writePath.string());
            ::close(r);
            r = -1;
            continue;
        }

        auto id = attach(ipc::PipeStream::adopt(io_context_.get_executor(), r, w, boundEndpoint_));
        r = -1;

        std::unique_lock<std::mutex> lock(mutex_);
        while (!token.stop_requested() && sessions_.contains(id)) {
            cv_.wait_for(lock, std::chrono::milliseconds(100));
        }
    }
    if (r >= 0) {
        ::close(r);
    }
}

template <typename Acceptor> awaitable<void> SocketServer::accept_loop(Acceptor& acceptor) {
    using Protocol = typename Acceptor::protocol_type;
    const auto backoff = std::chrono::milliseconds(100);

    while (running_.load() && acceptor.is_open()) {
        boost::asio::any_io_executor executor = io_context_.get_executor();
        ipc::strand_t strand = boost::asio::make_strand(executor);
        auto socket = std::make_shared<typename Protocol::socket>(strand);

        auto [ec] = co_await acceptor.async_accept(*socket, boost::asio::as_tuple(use_awaitable));
        if (ec) {
            if (!running_.load() || ec == boost::asio::error::operation_aborted) {
                break;
            }
            spdlog::warn("Accept error: {} ({})", ec.message(), ec.value());
            boost::asio::steady_timer timer(io_context_);
            timer.expires_after(backoff);
            auto [waitEc] = co_await timer.async_wait(boost::asio::as_tuple(use_awaitable));
            (void)waitEc;
            continue;
        }

        std::string description;
        boost::system::error_code peerEc;
        auto remote = socket->remote_endpoint(peerEc);
        if constexpr (std::is_same_v<Protocol, tcp>) {
            description = peerEc ? std::string("tcp client")
                                 : bsplink::format("tcp://{}:{}", remote.address().to_string(),
                                                   remote.port());
        } else {
            (void)remote;
            description = boundEndpoint_;
        }
        attach(std::make_unique<ipc::SocketStream<Protocol>>(std::move(strand), std::move(socket),
                                                             std::move(description)));
    }
    co_return;
}

awaitable<void> SocketServer::idle_watchdog() {
    boost::asio::steady_timer timer(io_context_);
    const auto tick = std::min<std::chrono::milliseconds>(config_.idleShutdown,
                                                          std::chrono::milliseconds(1000));
    while (running_.load() && !stopRequested_.load()) {
        timer.expires_after(tick);
        auto [ec] = co_await timer.async_wait(boost::asio::as_tuple(use_awaitable));
        if (ec) {
            break;
        }
        if (activeSessions() == 0 &&
            steady_millis() - lastActivityMs_.load() >= config_.idleShutdown.count()) {
            spdlog::info("No sessions for {} ms; stopping build server",
                         config_.idleShutdown.count());
            request_stop();
            break;
        }
    }
    co_return;
}

uint64_t SocketServer::attach(std::unique_ptr<ipc::IDuplexStream> stream) {
    auto connection = ipc::Connection::create(std::move(stream), config_.transport);
    auto session =
        BuildServerSession::create(connection, workspace_, engine_, {workers_, compiles_},
                                   config_.session);

    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextSessionId_++;
        sessions_.emplace(id, session);
    }
    totalSessions_.fetch_add(1);
    lastActivityMs_.store(steady_millis());
    spdlog::info("Session {} opened ({}), active={}", id, session->describe(), activeSessions());

    std::weak_ptr<BuildServerSession> weak = session;
    session->start([this, id, weak](const Error& reason) {
        auto self = weak.lock();
        bool clean = self && self->shutdown_requested();
        spdlog::info("Session {} ended: {}", id, reason.message);
        on_session_closed(id, clean);
    });
    return id;
}

void SocketServer::on_session_closed(uint64_t id, bool clean) {
    lastSessionClean_.store(clean);
    lastActivityMs_.store(steady_millis());
    // Released off the session's own callback
    boost::asio::post(io_context_, [this, id, clean] {
        std::shared_ptr<BuildServerSession> finished;
        bool last = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(id);
            if (it != sessions_.end()) {
                finished = std::move(it->second);
                sessions_.erase(it);
            }
            // Connections that never initialized are not clients
            last = std::none_of(sessions_.begin(), sessions_.end(), [](const auto& entry) {
                auto state = entry.second->state();
                return state == BuildServerSession::State::Running ||
                       state == BuildServerSession::State::ShuttingDown;
            });
        }
        cv_.notify_all();
        if (clean && last && config_.exitAfterShutdown) {
            spdlog::info("Last session shut down; stopping build server");
            request_stop();
        }
    });
    if (singleSession_) {
        request_stop();
    }
}

void SocketServer::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_.store(true);
    }
    cv_.notify_all();
}

void SocketServer::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return stopRequested_.load() || !running_.load(); });
}

Result<void> SocketServer::stop() {
    if (!running_.exchange(false)) {
        return Result<void>();
    }
    request_stop();
    spdlog::info("Stopping build server on {}", boundEndpoint_);

    boost::system::error_code ec;
    if (tcpAcceptor_ && tcpAcceptor_->is_open()) {
        tcpAcceptor_->close(ec);
    }
    if (localAcceptor_ && localAcceptor_->is_open()) {
        localAcceptor_->close(ec);
    }
    if (signals_) {
        signals_->cancel(ec);
    }
    if (fifoThread_.joinable()) {
        fifoThread_.request_stop();
        fifoThread_.join();
    }

    std::vector<std::shared_ptr<BuildServerSession>> open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, session] : sessions_) {
            open.push_back(session);
        }
    }
    for (auto& session : open) {
        session->close();
    }

    work_guard_.reset();
    io_context_.stop();
    for (auto& thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    io_threads_.clear();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.clear();
    }
    open.clear();
    // Joins handlers still running on the pools
    compiles_.reset();
    workers_.reset();
    tcpAcceptor_.reset();
    localAcceptor_.reset();
    signals_.reset();

    if (!socketPath_.empty()) {
        std::error_code fsEc;
        std::filesystem::remove(socketPath_, fsEc);
        socketPath_.clear();
    }
    spdlog::info("Build server stopped (sessions served={})", totalSessions_.load());
    return Result<void>();
}

std::string SocketServer::endpoint() const {
    return boundEndpoint_;
}

std::size_t SocketServer::activeSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace bsplink::server
