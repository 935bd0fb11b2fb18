#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/strand.hpp>

#include <bsplink/core/types.h>
#include <bsplink/ipc/endpoint.h>
#include <bsplink/ipc/transport_options.h>

namespace bsplink::ipc {

// One bidirectional byte stream, independent of the underlying channel.
//
// Reads and writes must be initiated from coroutines running on get_executor() (the stream's
// strand). close() may be called from any thread, is idempotent, and makes outstanding and
// later operations fail with ConnectionLost.
class IDuplexStream {
public:
    virtual ~IDuplexStream() = default;

    virtual boost::asio::awaitable<Result<std::size_t>> async_read_some(std::span<char> buffer) = 0;
    virtual boost::asio::awaitable<Result<void>> async_write_all(std::string_view data) = 0;

    virtual void close() noexcept = 0;
    virtual bool is_open() const noexcept = 0;

    virtual boost::asio::any_io_executor get_executor() const = 0;
    virtual std::string describe() const = 0;
};

using strand_t = boost::asio::strand<boost::asio::any_io_executor>;

// tcp and local (AF_UNIX) sockets
template <typename Protocol> class SocketStream final : public IDuplexStream {
public:
    using socket_t = typename Protocol::socket;

    SocketStream(strand_t strand, std::shared_ptr<socket_t> socket, std::string description)
        : strand_(std::move(strand)), socket_(std::move(socket)),
          description_(std::move(description)) {}
    ~SocketStream() override;

    boost::asio::awaitable<Result<std::size_t>> async_read_some(std::span<char> buffer) override;
    boost::asio::awaitable<Result<void>> async_write_all(std::string_view data) override;

    void close() noexcept override;
    bool is_open() const noexcept override { return !closed_.load(std::memory_order_acquire); }

    boost::asio::any_io_executor get_executor() const override { return strand_; }
    std::string describe() const override { return description_; }

private:
    strand_t strand_;
    std::shared_ptr<socket_t> socket_;
    std::string description_;
    std::atomic<bool> closed_{false};
};

using TcpStream = SocketStream<boost::asio::ip::tcp>;
using LocalStream = SocketStream<boost::asio::local::stream_protocol>;

// Read-direction and write-direction descriptors composed into one duplex stream
class PipeStream final : public IDuplexStream {
public:
    using descriptor_t = boost::asio::posix::stream_descriptor;

    PipeStream(strand_t strand, std::shared_ptr<descriptor_t> reader,
               std::shared_ptr<descriptor_t> writer, std::string description)
        : strand_(std::move(strand)), reader_(std::move(reader)), writer_(std::move(writer)),
          description_(std::move(description)) {}
    ~PipeStream() override;

    // Takes ownership of both descriptors.
    static std::unique_ptr<PipeStream> adopt(const boost::asio::any_io_executor& executor,
                                             int readFd, int writeFd, std::string description);

    boost::asio::awaitable<Result<std::size_t>> async_read_some(std::span<char> buffer) override;
    boost::asio::awaitable<Result<void>> async_write_all(std::string_view data) override;

    void close() noexcept override;
    bool is_open() const noexcept override { return !closed_.load(std::memory_order_acquire); }

    boost::asio::any_io_executor get_executor() const override { return strand_; }
    std::string describe() const override { return description_; }

private:
    strand_t strand_;
    std::shared_ptr<descriptor_t> reader_;
    std::shared_ptr<descriptor_t> writer_;
    std::string description_;
    std::atomic<bool> closed_{false};
};

// Connect to an endpoint, bounded by options.connectTimeout. Descriptor pipe endpoints are
// duplicated, so the caller keeps ownership of the fds named in the endpoint.
boost::asio::awaitable<Result<std::unique_ptr<IDuplexStream>>>
open_stream(const TransportEndpoint& endpoint, const TransportOptions& options);

// Executor used when TransportOptions does not name one.
boost::asio::any_io_executor default_executor(const TransportOptions& options);

} // namespace bsplink::ipc
