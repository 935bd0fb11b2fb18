#include <gtest/gtest.h>
#include <bsplink/ipc/endpoint.h>
#include <bsplink/ipc/transport_failure.h>

using namespace bsplink;
using namespace bsplink::ipc;

TEST(EndpointParse, TcpHostAndPort) {
    auto parsed = parse_endpoint("tcp://127.0.0.1:5005");
    ASSERT_TRUE(parsed) << parsed.error().message;
    auto* tcp = std::get_if<TcpEndpoint>(&parsed.value());
    ASSERT_NE(tcp, nullptr);
    EXPECT_EQ(tcp->host, "127.0.0.1");
    EXPECT_EQ(tcp->port, 5005);
}

TEST(EndpointParse, TcpBracketedIpv6) {
    auto parsed = parse_endpoint("tcp://[::1]:9000");
    ASSERT_TRUE(parsed);
    auto& tcp = std::get<TcpEndpoint>(parsed.value());
    EXPECT_EQ(tcp.host, "::1");
    EXPECT_EQ(tcp.port, 9000);
    EXPECT_EQ(to_string(parsed.value()), "tcp://[::1]:9000");
}

TEST(EndpointParse, TcpRejectsBadPorts) {
    for (const char* text : {"tcp://localhost", "tcp://localhost:0", "tcp://localhost:70000",
                             "tcp://localhost:12ab", "tcp://:80"}) {
        auto parsed = parse_endpoint(text);
        ASSERT_FALSE(parsed) << text;
        EXPECT_EQ(parsed.error().code, ErrorCode::MalformedAddress) << text;
        EXPECT_EQ(parseTransportFailureKind(parsed.error().message),
                  TransportFailureKind::MalformedAddress);
    }
}

TEST(EndpointParse, LocalSocketAndUnixAlias) {
    auto local = parse_endpoint("local:///tmp/bsp.sock");
    auto unixAlias = parse_endpoint("unix:///tmp/bsp.sock");
    ASSERT_TRUE(local);
    ASSERT_TRUE(unixAlias);
    EXPECT_EQ(local.value(), unixAlias.value());
    EXPECT_EQ(std::get<LocalSocketEndpoint>(local.value()).path, "/tmp/bsp.sock");
    EXPECT_EQ(to_string(unixAlias.value()), "local:///tmp/bsp.sock");
}

TEST(EndpointParse, LocalSocketRequiresAbsolutePath) {
    EXPECT_FALSE(parse_endpoint("local://relative.sock"));
    EXPECT_FALSE(parse_endpoint("local://"));
}

TEST(EndpointParse, PipePairAndDescriptors) {
    auto pipe = parse_endpoint("pipe:///tmp/in,/tmp/out");
    ASSERT_TRUE(pipe);
    auto& p = std::get<PipeEndpoint>(pipe.value());
    EXPECT_EQ(p.readPath, "/tmp/in");
    EXPECT_EQ(p.writePath, "/tmp/out");
    EXPECT_FALSE(p.usesDescriptors());

    auto fds = parse_endpoint("fd://5,6");
    ASSERT_TRUE(fds);
    auto& f = std::get<PipeEndpoint>(fds.value());
    EXPECT_TRUE(f.usesDescriptors());
    EXPECT_EQ(f.readFd, 5);
    EXPECT_EQ(f.writeFd, 6);
    EXPECT_EQ(to_string(fds.value()), "fd://5,6");

    EXPECT_FALSE(parse_endpoint("pipe:///tmp/only-one"));
    EXPECT_FALSE(parse_endpoint("fd://-1,2"));
}

TEST(EndpointParse, Stdio) {
    auto parsed = parse_endpoint("stdio");
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(is_stdio(parsed.value()));
    EXPECT_EQ(to_string(parsed.value()), "stdio");
    EXPECT_FALSE(is_stdio(TransportEndpoint{TcpEndpoint{"localhost", 1}}));
}

TEST(EndpointParse, UnknownOrMissingScheme) {
    EXPECT_FALSE(parse_endpoint("/tmp/bsp.sock"));
    auto parsed = parse_endpoint("http://localhost:80");
    ASSERT_FALSE(parsed);
    EXPECT_NE(parsed.error().message.find("unknown scheme"), std::string::npos);
}

TEST(EndpointParse, TextFormRoundTripsForKeys) {
    for (const char* text : {"tcp://localhost:8080", "local:///run/bsp.sock",
                             "pipe:///a/r,/a/w", "fd://3,4", "stdio"}) {
        auto parsed = parse_endpoint(text);
        ASSERT_TRUE(parsed) << text;
        EXPECT_EQ(endpoint_key(parsed.value()), text);
    }
}
