#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <bsplink/core/types.h>
#include <bsplink/ipc/connection.h>
#include <bsplink/ipc/thread_pool.h>

namespace bsplink::ipc {

using json = nlohmann::json;

// Per-request context handed to server-side handlers.
struct RequestContext {
    json id;
    std::string method;
    std::shared_ptr<std::atomic<bool>> cancelled;

    bool is_cancelled() const noexcept {
        return cancelled && cancelled->load(std::memory_order_acquire);
    }
};

/**
 * JSON-RPC 2.0 endpoint over a Connection, used by both sides of the link.
 *
 * - Outgoing requests get ids from a per-peer monotonically increasing counter and are
 *   correlated through a mutex-protected pending table; waiters poll their future with a
 *   timer so no I/O thread blocks on a response.
 * - Incoming requests are executed on the supplied ThreadPool (inline when none), or on the
 *   pool routed for their method, and a handler error becomes a JSON-RPC error response.
 * - Incoming notifications are delivered inline, in arrival order.
 * - When the connection ends every pending request fails with ConnectionLost.
 *
 * Handlers must be installed before start().
 */
class JsonRpcPeer : public std::enable_shared_from_this<JsonRpcPeer> {
public:
    using RequestHandler = std::function<Result<json>(const RequestContext&, const json& params)>;
    using NotificationHandler = std::function<void(const std::string& method, const json& params)>;
    using CloseHandler = std::function<void(const Error& reason)>;

    struct PendingRequest {
        int64_t id{0};
        std::string method;
        std::shared_future<Result<json>> response;
    };

    static std::shared_ptr<JsonRpcPeer> create(std::shared_ptr<Connection> connection,
                                               std::shared_ptr<ThreadPool> pool = nullptr);
    ~JsonRpcPeer();

    JsonRpcPeer(const JsonRpcPeer&) = delete;
    JsonRpcPeer& operator=(const JsonRpcPeer&) = delete;

    void set_request_handler(RequestHandler handler) { requestHandler_ = std::move(handler); }
    void set_notification_handler(NotificationHandler handler) {
        notificationHandler_ = std::move(handler);
    }
    void set_close_handler(CloseHandler handler) { closeHandler_ = std::move(handler); }
    // Run requests for `method` on `pool` instead of the default pool.
    void route(std::string method, std::shared_ptr<ThreadPool> pool) {
        routes_[std::move(method)] = std::move(pool);
    }

    void start();

    // Send a request and return its id and response future without waiting.
    Result<PendingRequest> send_request(std::string_view method, json params);

    // Wait for a previously sent request. A non-positive timeout waits without deadline.
    boost::asio::awaitable<Result<json>> await_response(PendingRequest pending,
                                                        std::chrono::milliseconds timeout);

    boost::asio::awaitable<Result<json>> request(std::string method, json params,
                                                 std::chrono::milliseconds timeout);

    Result<void> notify(std::string_view method, json params = nullptr);

    // Send $/cancelRequest for an outgoing request.
    Result<void> cancel(int64_t id);

    // Flush and close the underlying connection.
    void close();

    std::size_t pending_count() const;
    std::shared_ptr<Connection> connection() const { return connection_; }

    static json build_request(int64_t id, std::string_view method, const json& params);
    static json build_notification(std::string_view method, const json& params);
    static json build_response(const json& id, const json& result);
    static json build_error(const json& id, int code, std::string_view message);

private:
    JsonRpcPeer(std::shared_ptr<Connection> connection, std::shared_ptr<ThreadPool> pool);

    void on_message(json message);
    void on_closed(const Error& reason);
    void handle_response(const json& message);
    void handle_request(json id, std::string method, json params);
    void handle_cancel(const json& params);
    void forget(int64_t id);

    std::shared_ptr<Connection> connection_;
    std::shared_ptr<ThreadPool> pool_;
    std::unordered_map<std::string, std::shared_ptr<ThreadPool>> routes_;
    RequestHandler requestHandler_;
    NotificationHandler notificationHandler_;
    CloseHandler closeHandler_;

    std::atomic<int64_t> nextId_{1};
    mutable std::mutex mutex_;
    std::unordered_map<int64_t, std::shared_ptr<std::promise<Result<json>>>> pending_;
    // Incoming requests still running, keyed by the dumped id
    std::unordered_map<std::string, std::shared_ptr<std::atomic<bool>>> inflight_;
    bool closed_{false};
    Error closeReason_;
};

} // namespace bsplink::ipc
