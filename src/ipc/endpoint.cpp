#include <bsplink/core/format.h>
#include <bsplink/ipc/endpoint.h>
#include <bsplink/ipc/transport_failure.h>

#include <charconv>

namespace bsplink::ipc {

namespace {

Error malformed(std::string_view text, std::string_view why) {
    return transportError(TransportFailureKind::MalformedAddress,
                          bsplink::format("'{}': {}", text, why));
}

bool parse_int(std::string_view s, long long& out) {
    if (s.empty())
        return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

std::pair<std::string_view, std::string_view> split_pair(std::string_view rest) {
    auto comma = rest.find(',');
    if (comma == std::string_view::npos)
        return {rest, {}};
    return {rest.substr(0, comma), rest.substr(comma + 1)};
}

} // namespace

Result<TransportEndpoint> parse_endpoint(std::string_view text) {
    if (text == "stdio") {
        PipeEndpoint p;
        p.readFd = 0;
        p.writeFd = 1;
        return TransportEndpoint{p};
    }

    auto sep = text.find("://");
    if (sep == std::string_view::npos) {
        return malformed(text, "missing scheme (expected tcp://, local://, pipe://, fd:// or stdio)");
    }
    auto scheme = text.substr(0, sep);
    auto rest = text.substr(sep + 3);

    if (scheme == "tcp") {
        std::string_view host;
        std::string_view port;
        if (!rest.empty() && rest.front() == '[') {
            auto close = rest.find(']');
            if (close == std::string_view::npos || close + 1 >= rest.size() ||
                rest[close + 1] != ':') {
                return malformed(text, "bad bracketed host");
            }
            host = rest.substr(1, close - 1);
            port = rest.substr(close + 2);
        } else {
            auto colon = rest.rfind(':');
            if (colon == std::string_view::npos) {
                return malformed(text, "missing port");
            }
            host = rest.substr(0, colon);
            port = rest.substr(colon + 1);
        }
        long long portValue = 0;
        if (host.empty()) {
            return malformed(text, "empty host");
        }
        if (!parse_int(port, portValue) || portValue <= 0 || portValue > 65535) {
            return malformed(text, "port must be in 1..65535");
        }
        return TransportEndpoint{TcpEndpoint{std::string(host), static_cast<uint16_t>(portValue)}};
    }

    if (scheme == "local" || scheme == "unix") {
        if (rest.empty()) {
            return malformed(text, "empty socket path");
        }
        if (rest.front() != '/') {
            return malformed(text, "socket path must be absolute");
        }
        return TransportEndpoint{LocalSocketEndpoint{std::filesystem::path(std::string(rest))}};
    }

    if (scheme == "pipe") {
        auto [readPath, writePath] = split_pair(rest);
        if (readPath.empty() || writePath.empty()) {
            return malformed(text, "expected pipe://read-path,write-path");
        }
        PipeEndpoint p;
        p.readPath = std::string(readPath);
        p.writePath = std::string(writePath);
        return TransportEndpoint{p};
    }

    if (scheme == "fd") {
        auto [readFd, writeFd] = split_pair(rest);
        long long r = -1;
        long long w = -1;
        if (!parse_int(readFd, r) || !parse_int(writeFd, w) || r < 0 || w < 0) {
            return malformed(text, "expected fd://read-fd,write-fd");
        }
        PipeEndpoint p;
        p.readFd = static_cast<int>(r);
        p.writeFd = static_cast<int>(w);
        return TransportEndpoint{p};
    }

    return malformed(text, bsplink::format("unknown scheme '{}'", scheme));
}

std::string to_string(const TransportEndpoint& endpoint) {
    if (auto* tcp = std::get_if<TcpEndpoint>(&endpoint)) {
        if (tcp->host.find(':') != std::string::npos)
            return bsplink::format("tcp://[{}]:{}", tcp->host, tcp->port);
        return bsplink::format("tcp://{}:{}", tcp->host, tcp->port);
    }
    if (auto* local = std::get_if<LocalSocketEndpoint>(&endpoint)) {
        return "local://" + local->path.string();
    }
    const auto& pipe = std::get<PipeEndpoint>(endpoint);
    if (pipe.isStdio())
        return "stdio";
    if (pipe.usesDescriptors())
        return bsplink::format("fd://{},{}", pipe.readFd, pipe.writeFd);
    return bsplink::format("pipe://{},{}", pipe.readPath.string(), pipe.writePath.string());
}

} // namespace bsplink::ipc
