#include <bsplink/core/format.h>
#include <bsplink/ipc/bsp_protocol.h>
#include <bsplink/ipc/json_rpc_peer.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace bsplink::ipc {

using boost::asio::awaitable;
using boost::asio::use_awaitable;

std::shared_ptr<JsonRpcPeer> JsonRpcPeer::create(std::shared_ptr<Connection> connection,
                                                 std::shared_ptr<ThreadPool> pool) {
    return std::shared_ptr<JsonRpcPeer>(new JsonRpcPeer(std::move(connection), std::move(pool)));
}

JsonRpcPeer::JsonRpcPeer(std::shared_ptr<Connection> connection, std::shared_ptr<ThreadPool> pool)
    : connection_(std::move(connection)), pool_(std::move(pool)) {}

JsonRpcPeer::~JsonRpcPeer() {
    connection_->close();
}

void JsonRpcPeer::start() {
    std::weak_ptr<JsonRpcPeer> weak = weak_from_this();
    connection_->start(
        [weak](json message) {
            if (auto self = weak.lock()) {
                self->on_message(std::move(message));
            }
        },
        [weak](const Error& reason) {
            if (auto self = weak.lock()) {
                self->on_closed(reason);
            }
        });
}

json JsonRpcPeer::build_request(int64_t id, std::string_view method, const json& params) {
    json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", std::string(method)}};
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

json JsonRpcPeer::build_notification(std::string_view method, const json& params) {
    json notification = {{"jsonrpc", "2.0"}, {"method", std::string(method)}};
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

json JsonRpcPeer::build_response(const json& id, const json& result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json JsonRpcPeer::build_error(const json& id, int code, std::string_view message) {
    return json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", json{{"code", code}, {"message", std::string(message)}}}};
}

Result<JsonRpcPeer::PendingRequest> JsonRpcPeer::send_request(std::string_view method,
                                                              json params) {
    auto promise = std::make_shared<std::promise<Result<json>>>();
    PendingRequest pending;
    pending.method = std::string(method);
    pending.response = promise->get_future().share();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return Error{ErrorCode::ConnectionLost, closeReason_.message};
        }
        pending.id = nextId_.fetch_add(1, std::memory_order_relaxed);
        pending_.emplace(pending.id, promise);
    }

    auto sent = connection_->send(build_request(pending.id, method, params));
    if (!sent) {
        forget(pending.id);
        return sent.error();
    }
    spdlog::debug("JsonRpcPeer: sent request id={} method='{}'", pending.id, method);
    return pending;
}

awaitable<Result<json>> JsonRpcPeer::await_response(PendingRequest pending,
                                                    std::chrono::milliseconds timeout) {
    using namespace std::chrono_literals;
    const bool bounded = timeout.count() > 0;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

    // Poll future with timeout
    while (!bounded || std::chrono::steady_clock::now() < deadline) {
        if (pending.response.wait_for(0ms) == std::future_status::ready) {
            co_return pending.response.get();
        }
        timer.expires_after(10ms);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
    }

    forget(pending.id);
    if (pending.response.wait_for(0ms) == std::future_status::ready) {
        co_return pending.response.get();
    }
    spdlog::warn("JsonRpcPeer: timeout after {}ms waiting for '{}' (id={})", timeout.count(),
                 pending.method, pending.id);
    co_return Error{ErrorCode::Timeout, bsplink::format("{} timed out after {}ms", pending.method,
                                                        timeout.count())};
}

awaitable<Result<json>> JsonRpcPeer::request(std::string method, json params,
                                             std::chrono::milliseconds timeout) {
    auto pending = send_request(method, std::move(params));
    if (!pending) {
        co_return pending.error();
    }
    auto response = co_await await_response(std::move(pending).value(), timeout);
    co_return response;
}

Result<void> JsonRpcPeer::notify(std::string_view method, json params) {
    return connection_->send(build_notification(method, params));
}

Result<void> JsonRpcPeer::cancel(int64_t id) {
    return notify(methods::kCancelRequest, json{{"id", id}});
}

void JsonRpcPeer::close() {
    connection_->close();
}

std::size_t JsonRpcPeer::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void JsonRpcPeer::forget(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(id);
}

void JsonRpcPeer::on_message(json message) {
    if (auto it = message.find("jsonrpc"); it != message.end() && *it != "2.0") {
        connection_->fail(Error{ErrorCode::ProtocolError, "unsupported JSON-RPC version"});
        return;
    }

    auto method = message.find("method");
    auto id = message.find("id");
    if (method != message.end()) {
        if (!method->is_string()) {
            connection_->fail(Error{ErrorCode::ProtocolError, "method must be a string"});
            return;
        }
        json params = message.contains("params") ? message["params"] : json::object();
        if (id != message.end() && !id->is_null()) {
            handle_request(*id, method->get<std::string>(), std::move(params));
            return;
        }
        auto name = method->get<std::string>();
        if (name == methods::kCancelRequest) {
            handle_cancel(params);
            return;
        }
        if (notificationHandler_) {
            notificationHandler_(name, params);
        } else {
            spdlog::debug("JsonRpcPeer: dropping notification '{}'", name);
        }
        return;
    }

    if (id != message.end() && (message.contains("result") || message.contains("error"))) {
        handle_response(message);
        return;
    }

    connection_->fail(Error{ErrorCode::ProtocolError, "message is neither request nor response"});
}

void JsonRpcPeer::handle_response(const json& message) {
    const auto& idValue = message["id"];
    if (!idValue.is_number_integer()) {
        spdlog::debug("JsonRpcPeer: discarding response with foreign id {}", idValue.dump());
        return;
    }
    auto id = idValue.get<int64_t>();

    std::shared_ptr<std::promise<Result<json>>> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            // The waiter timed out before the response arrived
            spdlog::debug("JsonRpcPeer: discarding response for unknown id={}", id);
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }

    if (auto err = message.find("error"); err != message.end() && err->is_object()) {
        int code = err->value("code", static_cast<int>(JsonRpcErrorCode::InternalError));
        std::string text = err->value("message", std::string("unknown error"));
        promise->set_value(Error{fromJsonRpcError(code), std::move(text)});
        return;
    }
    promise->set_value(message.contains("result") ? message["result"] : json());
}

void JsonRpcPeer::handle_request(json id, std::string method, json params) {
    auto key = id.dump();
    if (!requestHandler_) {
        (void)connection_->send(build_error(id, static_cast<int>(JsonRpcErrorCode::MethodNotFound),
                                            bsplink::format("method not found: {}", method)));
        return;
    }

    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inflight_[key] = cancelled;
    }

    auto pool = pool_;
    if (auto routed = routes_.find(method); routed != routes_.end() && routed->second) {
        pool = routed->second;
    }

    auto self = shared_from_this();
    auto task = [self, key, cancelled, id = std::move(id), method = std::move(method),
                 params = std::move(params)]() {
        RequestContext ctx{id, method, cancelled};
        Result<json> result = Error{ErrorCode::InternalError, "handler did not run"};
        try {
            result = self->requestHandler_(ctx, params);
        } catch (const std::exception& e) {
            result = Error{ErrorCode::InternalError, e.what()};
        }
        {
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->inflight_.erase(key);
        }
        json response;
        if (result) {
            response = build_response(id, result.value());
        } else {
            response = build_error(id, static_cast<int>(toJsonRpcError(result.error().code)),
                                   result.error().message);
        }
        if (auto sent = self->connection_->send(response); !sent) {
            spdlog::debug("JsonRpcPeer: response to '{}' not delivered: {}", method,
                          sent.error().message);
        }
    };

    if (pool) {
        if (!pool->post(std::move(task))) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                inflight_.erase(key);
            }
            (void)connection_->send(build_error(json::parse(key),
                                                static_cast<int>(JsonRpcErrorCode::InternalError),
                                                "server is shutting down"));
        }
    } else {
        task();
    }
}

void JsonRpcPeer::handle_cancel(const json& params) {
    auto it = params.find("id");
    if (it == params.end()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto found = inflight_.find(it->dump()); found != inflight_.end()) {
        found->second->store(true, std::memory_order_release);
    }
}

void JsonRpcPeer::on_closed(const Error& reason) {
    std::unordered_map<int64_t, std::shared_ptr<std::promise<Result<json>>>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        closeReason_ = Error{ErrorCode::ConnectionLost, reason.message};
        pending.swap(pending_);
        for (auto& [key, flag] : inflight_) {
            flag->store(true, std::memory_order_release);
        }
    }
    for (auto& [id, promise] : pending) {
        promise->set_value(Error{ErrorCode::ConnectionLost, reason.message});
    }
    if (closeHandler_) {
        closeHandler_(reason);
    }
}

} // namespace bsplink::ipc
