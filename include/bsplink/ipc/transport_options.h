#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <boost/asio/any_io_executor.hpp>

namespace bsplink::ipc {

struct TransportOptions {
    std::chrono::milliseconds connectTimeout{2000};
    std::chrono::milliseconds requestTimeout{30000};
    // No frames in either direction for this long fails the connection; 0 disables.
    std::chrono::milliseconds idleTimeout{0};
    std::size_t maxFrameBytes{64 * 1024 * 1024};
    std::optional<boost::asio::any_io_executor> executor;
};

} // namespace bsplink::ipc
