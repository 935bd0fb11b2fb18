#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

#include <bsplink/core/types.h>

namespace bsplink::ipc {

struct TcpEndpoint {
    std::string host;
    uint16_t port{0};

    bool operator==(const TcpEndpoint&) const = default;
};

struct LocalSocketEndpoint {
    std::filesystem::path path;

    bool operator==(const LocalSocketEndpoint&) const = default;
};

// A read-direction and a write-direction channel. Either already-open descriptors
// (readFd/writeFd >= 0) or named FIFOs opened on connect.
struct PipeEndpoint {
    int readFd{-1};
    int writeFd{-1};
    std::filesystem::path readPath;
    std::filesystem::path writePath;

    bool usesDescriptors() const noexcept { return readFd >= 0 && writeFd >= 0; }
    bool isStdio() const noexcept { return readFd == 0 && writeFd == 1; }

    bool operator==(const PipeEndpoint&) const = default;
};

using TransportEndpoint = std::variant<TcpEndpoint, LocalSocketEndpoint, PipeEndpoint>;

// Accepted forms:
//   tcp://host:port            ([v6]:port accepted)
//   local:///abs/path          (unix:///abs/path is an alias)
//   pipe://read-path,write-path
//   fd://read-fd,write-fd
//   stdio                      (fd 0 for reading, fd 1 for writing)
Result<TransportEndpoint> parse_endpoint(std::string_view text);

std::string to_string(const TransportEndpoint& endpoint);

// Short stable label used for logs and registry keys.
inline std::string endpoint_key(const TransportEndpoint& endpoint) {
    return to_string(endpoint);
}

inline bool is_stdio(const TransportEndpoint& endpoint) {
    auto* pipe = std::get_if<PipeEndpoint>(&endpoint);
    return pipe && pipe->isStdio();
}

} // namespace bsplink::ipc
