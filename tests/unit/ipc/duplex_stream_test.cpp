#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <bsplink/client/run_sync.h>
#include <bsplink/ipc/duplex_stream.h>
#include <bsplink/ipc/transport_failure.h>

#include "common/bsp_test_helpers.h"

#include <array>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bsplink::ipc::test {

using namespace std::chrono_literals;
using boost::asio::awaitable;

namespace {

// Stream operations must start on the stream's strand
template <typename T> Result<T> run_on(IDuplexStream& stream, awaitable<Result<T>> op) {
    return client::run_sync(
        boost::asio::co_spawn(stream.get_executor(), std::move(op), boost::asio::use_awaitable),
        5s);
}

awaitable<Result<std::string>> read_text(IDuplexStream& stream) {
    std::array<char, 256> buffer{};
    auto n = co_await stream.async_read_some(std::span<char>(buffer.data(), buffer.size()));
    if (!n) {
        co_return n.error();
    }
    co_return std::string(buffer.data(), n.value());
}

awaitable<Result<void>> write_text(IDuplexStream& stream, std::string text) {
    auto written = co_await stream.async_write_all(text);
    co_return written;
}

awaitable<Result<std::unique_ptr<IDuplexStream>>> open_endpoint(TransportEndpoint endpoint,
                                                          TransportOptions options) {
    auto r = co_await open_stream(endpoint, options);
    co_return std::move(r);
}

} // namespace

TEST(DuplexStream, SocketPairCarriesBytesBothWays) {
    auto [a, b] = bsplink::tests::make_stream_pair();
    ASSERT_TRUE(run_on(*a, write_text(*a, "ping")));
    auto got = run_on(*b, read_text(*b));
    ASSERT_TRUE(got) << got.error().message;
    EXPECT_EQ(got.value(), "ping");

    ASSERT_TRUE(run_on(*b, write_text(*b, "pong")));
    auto back = run_on(*a, read_text(*a));
    ASSERT_TRUE(back);
    EXPECT_EQ(back.value(), "pong");
}

TEST(DuplexStream, CloseIsIdempotentAndFailsLaterOperations) {
    auto [a, b] = bsplink::tests::make_stream_pair();
    a->close();
    a->close();
    EXPECT_FALSE(a->is_open());
    auto r = run_on(*a, read_text(*a));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionLost);
    EXPECT_EQ(parseTransportFailureKind(r.error().message), TransportFailureKind::Cancelled);
}

TEST(DuplexStream, PeerCloseReadsAsEof) {
    auto [a, b] = bsplink::tests::make_stream_pair();
    b->close();
    auto r = run_on(*a, read_text(*a));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionLost);
}

TEST(DuplexStream, LocalSocketWithoutListenerIsRefused) {
    bsplink::tests::TempDir dir;
    TransportOptions options;
    options.connectTimeout = 500ms;
    auto r = client::run_sync(
        open_endpoint(TransportEndpoint{LocalSocketEndpoint{dir / "missing.sock"}}, options), 5s);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionRefused);
}

TEST(DuplexStream, TcpClosedPortIsRefused) {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor probe(
        io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    auto port = probe.local_endpoint().port();
    probe.close();

    TransportOptions options;
    options.connectTimeout = 1s;
    auto r = client::run_sync(open_endpoint(TransportEndpoint{TcpEndpoint{"127.0.0.1", port}}, options),
                              5s);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionRefused);
}

TEST(DuplexStream, FifoWithoutReaderIsRefused) {
    bsplink::tests::TempDir dir;
    auto in = dir / "in";
    auto out = dir / "out";
    ASSERT_EQ(::mkfifo(in.c_str(), 0600), 0);
    ASSERT_EQ(::mkfifo(out.c_str(), 0600), 0);

    PipeEndpoint endpoint;
    endpoint.readPath = in;
    endpoint.writePath = out;
    auto r = client::run_sync(open_endpoint(TransportEndpoint{endpoint}, {}), 5s);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionRefused);
}

TEST(DuplexStream, DescriptorPipeEndpointDuplicatesFds) {
    int toStream[2];
    int fromStream[2];
    ASSERT_EQ(::pipe(toStream), 0);
    ASSERT_EQ(::pipe(fromStream), 0);

    PipeEndpoint endpoint;
    endpoint.readFd = toStream[0];
    endpoint.writeFd = fromStream[1];
    auto opened = client::run_sync(open_endpoint(TransportEndpoint{endpoint}, {}), 5s);
    ASSERT_TRUE(opened) << opened.error().message;
    auto stream = std::move(opened).value();

    // The caller keeps its descriptors
    ::close(toStream[0]);
    ::close(fromStream[1]);

    ASSERT_TRUE(bsplink::tests::write_all(toStream[1], "abc"));
    auto got = run_on(*stream, read_text(*stream));
    ASSERT_TRUE(got) << got.error().message;
    EXPECT_EQ(got.value(), "abc");

    ASSERT_TRUE(run_on(*stream, write_text(*stream, "xyz")));
    char buf[8] = {};
    ASSERT_EQ(::read(fromStream[0], buf, sizeof(buf)), 3);
    EXPECT_EQ(std::string(buf, 3), "xyz");

    stream->close();
    ::close(toStream[1]);
    ::close(fromStream[0]);
}

} // namespace bsplink::ipc::test
