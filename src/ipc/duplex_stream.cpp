#include <bsplink/core/format.h>
#include <bsplink/ipc/duplex_stream.h>
#include <bsplink/ipc/global_io_context.h>
#include <bsplink/ipc/transport_failure.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/un.h>

namespace bsplink::ipc {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;

namespace {

Error closedError(const std::string& description) {
    return transportError(TransportFailureKind::Cancelled,
                          bsplink::format("stream closed ({})", description));
}

Error errnoError(TransportFailureKind kind, std::string_view what, int err) {
    return transportError(kind, bsplink::format("{}: {}", what, std::strerror(err)));
}

TransportFailureKind classifyErrno(int err) {
    switch (err) {
        case ENXIO:
        case ENOENT:
        case ECONNREFUSED:
            return TransportFailureKind::Refused;
        case EACCES:
        case EPERM:
            return TransportFailureKind::PermissionDenied;
        default:
            return TransportFailureKind::Other;
    }
}

// Bound an in-flight connect: when the timer fires first it closes the socket, which
// aborts the connect on the same strand.
template <typename Socket> struct ConnectDeadline {
    ConnectDeadline(const strand_t& strand, std::shared_ptr<Socket> socket,
                    std::chrono::milliseconds timeout)
        : timer(strand), expired(std::make_shared<bool>(false)) {
        timer.expires_after(timeout);
        timer.async_wait([socket, flag = expired](const boost::system::error_code& ec) {
            if (!ec) {
                *flag = true;
                boost::system::error_code ignored;
                socket->close(ignored);
            }
        });
    }
    ~ConnectDeadline() { timer.cancel(); }

    bool fired() const { return *expired; }

    boost::asio::steady_timer timer;
    std::shared_ptr<bool> expired;
};

awaitable<Result<std::unique_ptr<IDuplexStream>>>
connect_tcp(strand_t strand, TcpEndpoint endpoint, std::chrono::milliseconds timeout) {
    using tcp = boost::asio::ip::tcp;
    auto description = to_string(TransportEndpoint{endpoint});

    tcp::resolver resolver(strand);
    boost::system::error_code ec;
    auto results = co_await resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
                                                   redirect_error(use_awaitable, ec));
    if (ec) {
        co_return transportError(TransportFailureKind::MalformedAddress,
                                 bsplink::format("cannot resolve '{}': {}", endpoint.host,
                                                 ec.message()));
    }

    auto socket = std::make_shared<tcp::socket>(strand);
    bool timedOut = false;
    {
        ConnectDeadline<tcp::socket> deadline(strand, socket, timeout);
        co_await boost::asio::async_connect(*socket, results, redirect_error(use_awaitable, ec));
        timedOut = deadline.fired();
    }
    if (timedOut) {
        co_return transportError(TransportFailureKind::Timeout,
                                 bsplink::format("connect timeout ({})", description));
    }
    if (ec) {
        co_return transportError(ec, bsplink::format("connect {}", description));
    }
    boost::system::error_code ignored;
    socket->set_option(tcp::no_delay(true), ignored);
    std::unique_ptr<IDuplexStream> stream =
        std::make_unique<TcpStream>(strand, std::move(socket), std::move(description));
    co_return std::move(stream);
}

awaitable<Result<std::unique_ptr<IDuplexStream>>>
connect_local(strand_t strand, LocalSocketEndpoint endpoint, std::chrono::milliseconds timeout) {
    using local = boost::asio::local::stream_protocol;
    auto description = to_string(TransportEndpoint{endpoint});
    const auto& path = endpoint.path;

    if (path.string().size() >= sizeof(sockaddr_un{}.sun_path)) {
        co_return transportError(TransportFailureKind::MalformedAddress,
                                 bsplink::format("socket path too long ({})", path.string()));
    }
    {
        struct stat st;
        if (::stat(path.c_str(), &st) != 0) {
            int err = errno;
            co_return errnoError(classifyErrno(err),
                                 bsplink::format("socket not found at '{}'", path.string()), err);
        }
        if (!S_ISSOCK(st.st_mode)) {
            co_return transportError(TransportFailureKind::Refused,
                                     bsplink::format("path exists but is not a socket: '{}'",
                                                     path.string()));
        }
    }

    auto socket = std::make_shared<local::socket>(strand);
    boost::system::error_code ec;
    bool timedOut = false;
    {
        ConnectDeadline<local::socket> deadline(strand, socket, timeout);
        co_await socket->async_connect(local::endpoint(path.string()),
                                       redirect_error(use_awaitable, ec));
        timedOut = deadline.fired();
    }
    if (timedOut) {
        co_return transportError(TransportFailureKind::Timeout,
                                 bsplink::format("connect timeout ({})", description));
    }
    if (ec) {
        co_return transportError(ec, bsplink::format("connect {}", description));
    }
    std::unique_ptr<IDuplexStream> stream =
        std::make_unique<LocalStream>(strand, std::move(socket), std::move(description));
    co_return std::move(stream);
}

Result<std::unique_ptr<IDuplexStream>> open_pipe(const boost::asio::any_io_executor& executor,
                                                 const PipeEndpoint& endpoint) {
    auto description = to_string(TransportEndpoint{endpoint});
    if (endpoint.usesDescriptors()) {
        int r = ::fcntl(endpoint.readFd, F_DUPFD_CLOEXEC, 0);
        if (r < 0) {
            return errnoError(TransportFailureKind::Other, "dup(read)", errno);
        }
        int w = ::fcntl(endpoint.writeFd, F_DUPFD_CLOEXEC, 0);
        if (w < 0) {
            int err = errno;
            ::close(r);
            return errnoError(TransportFailureKind::Other, "dup(write)", err);
        }
        return std::unique_ptr<IDuplexStream>(
            PipeStream::adopt(executor, r, w, std::move(description)));
    }

    // O_RDWR on the read FIFO keeps it from reporting EOF before the peer opens its end.
    int r = ::open(endpoint.readPath.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (r < 0) {
        int err = errno;
        return errnoError(classifyErrno(err),
                          bsplink::format("open '{}'", endpoint.readPath.string()), err);
    }
    // With O_NONBLOCK, opening the write side fails with ENXIO while nobody reads it.
    int w = ::open(endpoint.writePath.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if (w < 0) {
        int err = errno;
        ::close(r);
        return errnoError(classifyErrno(err),
                          bsplink::format("open '{}'", endpoint.writePath.string()), err);
    }
    return std::unique_ptr<IDuplexStream>(
        PipeStream::adopt(executor, r, w, std::move(description)));
}

} // namespace

// SocketStream

template <typename Protocol> SocketStream<Protocol>::~SocketStream() {
    if (!closed_.exchange(true)) {
        boost::system::error_code ec;
        socket_->close(ec);
    }
}

template <typename Protocol>
awaitable<Result<std::size_t>> SocketStream<Protocol>::async_read_some(std::span<char> buffer) {
    if (closed_.load(std::memory_order_acquire)) {
        co_return closedError(description_);
    }
    boost::system::error_code ec;
    std::size_t n = co_await socket_->async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), redirect_error(use_awaitable, ec));
    if (closed_.load(std::memory_order_acquire)) {
        co_return closedError(description_);
    }
    if (ec) {
        co_return transportError(ec, bsplink::format("read {}", description_));
    }
    co_return n;
}

template <typename Protocol>
awaitable<Result<void>> SocketStream<Protocol>::async_write_all(std::string_view data) {
    if (closed_.load(std::memory_order_acquire)) {
        co_return closedError(description_);
    }
    boost::system::error_code ec;
    std::size_t n = co_await boost::asio::async_write(
        *socket_, boost::asio::buffer(data.data(), data.size()), redirect_error(use_awaitable, ec));
    if (closed_.load(std::memory_order_acquire)) {
        co_return closedError(description_);
    }
    if (ec) {
        co_return transportError(ec, bsplink::format("write {}", description_));
    }
    if (n != data.size()) {
        co_return transportError(TransportFailureKind::ResetOrBrokenPipe,
                                 bsplink::format("short write on {}", description_));
    }
    co_return Result<void>();
}

template <typename Protocol> void SocketStream<Protocol>::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    try {
        boost::asio::post(strand_, [socket = socket_]() {
            boost::system::error_code ec;
            socket->shutdown(socket_t::shutdown_both, ec);
            socket->close(ec);
        });
    } catch (const std::exception& e) {
        spdlog::warn("SocketStream::close post failed ({}): {}", description_, e.what());
    }
}

template class SocketStream<boost::asio::ip::tcp>;
template class SocketStream<boost::asio::local::stream_protocol>;

// PipeStream

std::unique_ptr<PipeStream> PipeStream::adopt(const boost::asio::any_io_executor& executor,
                                              int readFd, int writeFd, std::string description) {
    strand_t strand = boost::asio::make_strand(executor);
    auto reader = std::make_shared<descriptor_t>(strand, readFd);
    auto writer = std::make_shared<descriptor_t>(strand, writeFd);
    return std::make_unique<PipeStream>(strand, std::move(reader), std::move(writer),
                                        std::move(description));
}

PipeStream::~PipeStream() {
    if (!closed_.exchange(true)) {
        boost::system::error_code ec;
        reader_->close(ec);
        writer_->close(ec);
    }
}

awaitable<Result<std::size_t>> PipeStream::async_read_some(std::span<char> buffer) {
    if (closed_.load(std::memory_order_acquire)) {
        co_return closedError(description_);
    }
    boost::system::error_code ec;
    std::size_t n = co_await reader_->async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), redirect_error(use_awaitable, ec));
    if (closed_.load(std::memory_order_acquire)) {
        co_return closedError(description_);
    }
    if (ec) {
        co_return transportError(ec, bsplink::format("read {}", description_));
    }
    co_return n;
}

awaitable<Result<void>> PipeStream::async_write_all(std::string_view data) {
    if (closed_.load(std::memory_order_acquire)) {
        co_return closedError(description_);
    }
    boost::system::error_code ec;
    std::size_t n = co_await boost::asio::async_write(
        *writer_, boost::asio::buffer(data.data(), data.size()), redirect_error(use_awaitable, ec));
    if (closed_.load(std::memory_order_acquire)) {
        co_return closedError(description_);
    }
    if (ec) {
        co_return transportError(ec, bsplink::format("write {}", description_));
    }
    if (n != data.size()) {
        co_return transportError(TransportFailureKind::ResetOrBrokenPipe,
                                 bsplink::format("short write on {}", description_));
    }
    co_return Result<void>();
}

void PipeStream::close() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    try {
        boost::asio::post(strand_, [reader = reader_, writer = writer_]() {
            boost::system::error_code ec;
            reader->close(ec);
            writer->close(ec);
        });
    } catch (const std::exception& e) {
        spdlog::warn("PipeStream::close post failed ({}): {}", description_, e.what());
    }
}

// Factory

boost::asio::any_io_executor default_executor(const TransportOptions& options) {
    return options.executor ? *options.executor : GlobalIOContext::global_executor();
}

awaitable<Result<std::unique_ptr<IDuplexStream>>> open_stream(const TransportEndpoint& endpoint,
                                                              const TransportOptions& options) {
    auto executor = default_executor(options);
    if (auto* pipe = std::get_if<PipeEndpoint>(&endpoint)) {
        co_return open_pipe(executor, *pipe);
    }

    strand_t strand = boost::asio::make_strand(executor);
    if (auto* tcp = std::get_if<TcpEndpoint>(&endpoint)) {
        auto r = co_await boost::asio::co_spawn(
            strand, connect_tcp(strand, *tcp, options.connectTimeout), use_awaitable);
        co_return std::move(r);
    }
    auto r = co_await boost::asio::co_spawn(
        strand, connect_local(strand, std::get<LocalSocketEndpoint>(endpoint),
                              options.connectTimeout),
        use_awaitable);
    co_return std::move(r);
}

} // namespace bsplink::ipc
