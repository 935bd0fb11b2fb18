#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace bsplink {

using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    // Transport
    ConnectionRefused,
    Timeout,
    PermissionDenied,
    MalformedAddress,
    NetworkError,
    // Launcher
    SpawnFailed,
    ReadinessTimeout,
    VersionMismatch,
    // Protocol
    VersionIncompatible,
    MalformedHandshake,
    ProtocolError,
    ConnectionLost,
    // Request
    UnknownTarget,
    InvalidArgument,
    InvalidState,
    OperationCancelled,
    // Cache
    NotFound,
    DecodeFailed,
    ResourceExhausted,
    InternalError,
    Unknown
};

enum class ErrorCategory { None, Transport, Launcher, Protocol, Request, Cache, Internal };

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConnectionRefused: return "Connection refused";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::MalformedAddress: return "Malformed address";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::SpawnFailed: return "Failed to spawn build server";
        case ErrorCode::ReadinessTimeout: return "Build server did not become ready in time";
        case ErrorCode::VersionMismatch: return "Build server version mismatch";
        case ErrorCode::VersionIncompatible: return "Incompatible protocol version";
        case ErrorCode::MalformedHandshake: return "Malformed handshake";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::ConnectionLost: return "Connection lost";
        case ErrorCode::UnknownTarget: return "Unknown build target";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::DecodeFailed: return "Decode failed";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

constexpr ErrorCategory errorCategory(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success:
            return ErrorCategory::None;
        case ErrorCode::ConnectionRefused:
        case ErrorCode::Timeout:
        case ErrorCode::PermissionDenied:
        case ErrorCode::MalformedAddress:
        case ErrorCode::NetworkError:
            return ErrorCategory::Transport;
        case ErrorCode::SpawnFailed:
        case ErrorCode::ReadinessTimeout:
        case ErrorCode::VersionMismatch:
            return ErrorCategory::Launcher;
        case ErrorCode::VersionIncompatible:
        case ErrorCode::MalformedHandshake:
        case ErrorCode::ProtocolError:
        case ErrorCode::ConnectionLost:
            return ErrorCategory::Protocol;
        case ErrorCode::UnknownTarget:
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidState:
        case ErrorCode::OperationCancelled:
            return ErrorCategory::Request;
        case ErrorCode::NotFound:
        case ErrorCode::DecodeFailed:
            return ErrorCategory::Cache;
        case ErrorCode::ResourceExhausted:
        case ErrorCode::InternalError:
        case ErrorCode::Unknown:
            return ErrorCategory::Internal;
    }
    return ErrorCategory::Internal;
}

// Stable kebab-case names used for exit statuses and machine-readable output.
constexpr std::string_view errorKindName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "ok";
        case ErrorCode::ConnectionRefused: return "connection-refused";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::PermissionDenied: return "permission-denied";
        case ErrorCode::MalformedAddress: return "malformed-address";
        case ErrorCode::NetworkError: return "network-error";
        case ErrorCode::SpawnFailed: return "spawn-failed";
        case ErrorCode::ReadinessTimeout: return "readiness-timeout";
        case ErrorCode::VersionMismatch:
        case ErrorCode::VersionIncompatible: return "version-incompatible";
        case ErrorCode::MalformedHandshake:
        case ErrorCode::ProtocolError: return "protocol-error";
        case ErrorCode::ConnectionLost: return "connection-lost";
        case ErrorCode::UnknownTarget: return "unknown-target";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::InvalidState: return "invalid-state";
        case ErrorCode::OperationCancelled: return "cancelled";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::DecodeFailed: return "decode-failed";
        case ErrorCode::ResourceExhausted: return "resource-exhausted";
        case ErrorCode::InternalError:
        case ErrorCode::Unknown: return "internal-error";
    }
    return "internal-error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    ErrorCategory category() const noexcept { return errorCategory(code); }

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail (compatible with pre-C++23)
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace bsplink

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<bsplink::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(bsplink::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", bsplink::errorToString(error));
    }
};
