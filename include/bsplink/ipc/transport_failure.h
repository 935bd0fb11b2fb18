#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/system/error_code.hpp>

#include <bsplink/core/types.h>

namespace bsplink::ipc {

// Stable classification for transport (tcp, local socket, pipe) failures.
//
// The kind is carried as a prefix of Error.message so it propagates through Result/Error
// without widening ErrorCode.
enum class TransportFailureKind {
    Refused,
    Timeout,
    PermissionDenied,
    MalformedAddress,
    ResetOrBrokenPipe,
    Eof,
    Cancelled,
    Other
};

inline constexpr std::string_view kTransportFailurePrefix = "[transport:";

inline constexpr std::string_view to_string(TransportFailureKind k) {
    switch (k) {
        case TransportFailureKind::Refused:
            return "refused";
        case TransportFailureKind::Timeout:
            return "timeout";
        case TransportFailureKind::PermissionDenied:
            return "permission_denied";
        case TransportFailureKind::MalformedAddress:
            return "malformed_address";
        case TransportFailureKind::ResetOrBrokenPipe:
            return "reset_or_broken_pipe";
        case TransportFailureKind::Eof:
            return "eof";
        case TransportFailureKind::Cancelled:
            return "cancelled";
        case TransportFailureKind::Other:
            return "other";
    }
    return "other";
}

inline std::string formatTransportFailure(TransportFailureKind kind, std::string_view detail) {
    std::string out;
    out.reserve(kTransportFailurePrefix.size() + 32 + 2 + detail.size());
    out.append(kTransportFailurePrefix);
    out.append(to_string(kind));
    out.push_back(']');
    out.push_back(' ');
    out.append(detail);
    return out;
}

inline std::optional<TransportFailureKind> parseTransportFailureKind(std::string_view message) {
    if (!message.starts_with(kTransportFailurePrefix)) {
        return std::nullopt;
    }
    auto close = message.find(']');
    if (close == std::string_view::npos) {
        return std::nullopt;
    }
    // message looks like: [transport:<kind>] ...
    auto kindStart = kTransportFailurePrefix.size();
    if (close <= kindStart) {
        return std::nullopt;
    }
    auto kind = message.substr(kindStart, close - kindStart);
    if (kind == "refused")
        return TransportFailureKind::Refused;
    if (kind == "timeout")
        return TransportFailureKind::Timeout;
    if (kind == "permission_denied")
        return TransportFailureKind::PermissionDenied;
    if (kind == "malformed_address")
        return TransportFailureKind::MalformedAddress;
    if (kind == "reset_or_broken_pipe")
        return TransportFailureKind::ResetOrBrokenPipe;
    if (kind == "eof")
        return TransportFailureKind::Eof;
    if (kind == "cancelled")
        return TransportFailureKind::Cancelled;
    if (kind == "other")
        return TransportFailureKind::Other;
    return std::nullopt;
}

inline constexpr ErrorCode toErrorCode(TransportFailureKind kind) {
    switch (kind) {
        case TransportFailureKind::Refused:
            return ErrorCode::ConnectionRefused;
        case TransportFailureKind::Timeout:
            return ErrorCode::Timeout;
        case TransportFailureKind::PermissionDenied:
            return ErrorCode::PermissionDenied;
        case TransportFailureKind::MalformedAddress:
            return ErrorCode::MalformedAddress;
        case TransportFailureKind::ResetOrBrokenPipe:
        case TransportFailureKind::Eof:
        case TransportFailureKind::Cancelled:
            return ErrorCode::ConnectionLost;
        case TransportFailureKind::Other:
            return ErrorCode::NetworkError;
    }
    return ErrorCode::NetworkError;
}

inline Error transportError(TransportFailureKind kind, std::string_view detail) {
    return Error{toErrorCode(kind), formatTransportFailure(kind, detail)};
}

// Map a boost/system error raised by connect, read or write to a failure kind.
TransportFailureKind classify(const boost::system::error_code& ec) noexcept;

inline Error transportError(const boost::system::error_code& ec, std::string_view where) {
    auto kind = classify(ec);
    std::string detail(where);
    detail.append(": ");
    detail.append(ec.message());
    return transportError(kind, detail);
}

inline bool isTransient(TransportFailureKind kind) {
    switch (kind) {
        case TransportFailureKind::Timeout:
        case TransportFailureKind::ResetOrBrokenPipe:
        case TransportFailureKind::Eof:
        case TransportFailureKind::Cancelled:
            return true;
        case TransportFailureKind::Refused:
        case TransportFailureKind::PermissionDenied:
        case TransportFailureKind::MalformedAddress:
        case TransportFailureKind::Other:
            return false;
    }
    return false;
}

} // namespace bsplink::ipc
