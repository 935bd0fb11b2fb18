#pragma once

#include <chrono>
#include <future>
#include <type_traits>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <bsplink/ipc/global_io_context.h>

#include <bsplink/core/types.h>

namespace bsplink::client {

// Run a Boost.Asio awaitable<Result<T>> synchronously with a timeout.
// Returns Result<T> or a Timeout/InternalError on failure. Must not be called from a thread
// of the global io_context.
template <typename T, typename Rep, typename Period>
inline bsplink::Result<T> run_sync(boost::asio::awaitable<bsplink::Result<T>> aw,
                                   const std::chrono::duration<Rep, Period>& timeout) {
    try {
        auto prom = std::make_shared<std::promise<bsplink::Result<T>>>();
        auto fut = prom->get_future();
        boost::asio::co_spawn(
            bsplink::ipc::GlobalIOContext::global_executor(),
            [aw = std::move(aw), prom]() mutable -> boost::asio::awaitable<void> {
                try {
                    auto r = co_await std::move(aw);
                    prom->set_value(std::move(r));
                } catch (const std::exception& e) {
                    prom->set_value(bsplink::Error{bsplink::ErrorCode::InternalError, e.what()});
                }
                co_return;
            },
            boost::asio::detached);
        if (fut.wait_for(timeout) != std::future_status::ready) {
            return bsplink::Error{bsplink::ErrorCode::Timeout, "timeout"};
        }
        return fut.get();
    } catch (const std::exception& e) {
        return bsplink::Error{bsplink::ErrorCode::InternalError, e.what()};
    }
}

} // namespace bsplink::client
