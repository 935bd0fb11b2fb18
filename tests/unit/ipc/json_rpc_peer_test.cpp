#include <gtest/gtest.h>

#include <bsplink/client/run_sync.h>
#include <bsplink/ipc/bsp_protocol.h>
#include <bsplink/ipc/json_rpc_peer.h>

#include "common/bsp_test_helpers.h"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace bsplink::ipc::test {

using namespace std::chrono_literals;

namespace {

class JsonRpcPeerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto [a, b] = bsplink::tests::make_stream_pair();
        pool_ = std::make_shared<ThreadPool>("requests", 2);
        client_ = JsonRpcPeer::create(Connection::create(std::move(a)));
        server_ = JsonRpcPeer::create(Connection::create(std::move(b)), pool_);
    }

    void TearDown() override {
        client_->close();
        server_->close();
        pool_->stop();
    }

    Result<json> call(const std::string& method, json params,
                      std::chrono::milliseconds timeout = 2s) {
        return client::run_sync(client_->request(method, std::move(params), timeout), 5s);
    }

    std::shared_ptr<ThreadPool> pool_;
    std::shared_ptr<JsonRpcPeer> client_;
    std::shared_ptr<JsonRpcPeer> server_;
};

} // namespace

TEST_F(JsonRpcPeerTest, RequestGetsMatchingResponse) {
    server_->set_request_handler([](const RequestContext& ctx, const json& params) -> Result<json> {
        return json{{"echo", params.at("value")}, {"method", ctx.method}};
    });
    server_->start();
    client_->start();

    auto r = call("test/echo", json{{"value", 42}});
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value().at("echo"), 42);
    EXPECT_EQ(r.value().at("method"), "test/echo");
    EXPECT_EQ(client_->pending_count(), 0u);
}

TEST_F(JsonRpcPeerTest, RequestIdsIncrease) {
    server_->set_request_handler(
        [](const RequestContext&, const json&) -> Result<json> { return json(nullptr); });
    server_->start();
    client_->start();

    auto first = client_->send_request("a", nullptr);
    auto second = client_->send_request("b", nullptr);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_LT(first.value().id, second.value().id);
}

TEST_F(JsonRpcPeerTest, HandlerErrorMapsToJsonRpcError) {
    server_->set_request_handler([](const RequestContext&, const json&) -> Result<json> {
        return Error{ErrorCode::UnknownTarget, "no such target: file:///ws/?id=x"};
    });
    server_->start();
    client_->start();

    auto r = call(std::string(methods::kCompile), json::object());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::UnknownTarget);
    EXPECT_EQ(r.error().message, "no such target: file:///ws/?id=x");
}

TEST_F(JsonRpcPeerTest, MissingHandlerIsMethodNotFound) {
    server_->start();
    client_->start();
    auto r = call("test/nothing", nullptr);
    ASSERT_FALSE(r);
    // -32601 is not one of the codes mapped back to a specific kind
    EXPECT_EQ(r.error().code, ErrorCode::ProtocolError);
    EXPECT_NE(r.error().message.find("test/nothing"), std::string::npos);
}

TEST_F(JsonRpcPeerTest, NotificationsArriveInOrder) {
    std::mutex mutex;
    std::vector<int> seen;
    client_->set_notification_handler([&](const std::string& method, const json& params) {
        if (method == "test/tick") {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(params.at("n").get<int>());
        }
    });
    client_->start();
    server_->start();

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(server_->notify("test/tick", json{{"n", i}}));
    }
    ASSERT_TRUE(bsplink::tests::wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size() == 50;
    }));
    std::lock_guard<std::mutex> lock(mutex);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(seen[i], i);
    }
}

TEST_F(JsonRpcPeerTest, NotificationsSentBeforeResponseArriveFirst) {
    std::atomic<int> progress{0};
    std::atomic<bool> progressSeenFirst{false};
    client_->set_notification_handler(
        [&](const std::string&, const json&) { progress.fetch_add(1); });
    server_->set_request_handler([this](const RequestContext&, const json&) -> Result<json> {
        for (int i = 0; i < 3; ++i) {
            (void)server_->notify("test/progress", json{{"i", i}});
        }
        return json{{"done", true}};
    });
    server_->start();
    client_->start();

    auto r = call("test/work", nullptr);
    ASSERT_TRUE(r);
    progressSeenFirst = progress.load() == 3;
    EXPECT_TRUE(progressSeenFirst.load());
}

TEST_F(JsonRpcPeerTest, RoutedMethodRunsOnItsOwnPool) {
    auto slow = std::make_shared<ThreadPool>("slow", 1);
    std::atomic<bool> release{false};
    std::mutex mutex;
    std::vector<std::string> seen;
    server_->route("test/slow", slow);
    server_->set_request_handler(
        [&](const RequestContext& ctx, const json&) -> Result<json> {
            if (ctx.method == "test/slow") {
                bsplink::tests::wait_until([&] { return release.load(); }, 3s);
            }
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(ctx.method);
            return json(ctx.method);
        });
    server_->start();
    client_->start();

    // Two slow calls would occupy both default threads if they were not routed
    auto a = client_->send_request("test/slow", nullptr);
    auto b = client_->send_request("test/slow", nullptr);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    auto fast = call("test/fast", nullptr);
    ASSERT_TRUE(fast) << fast.error().message;
    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_EQ(seen, std::vector<std::string>{"test/fast"});
    }

    release.store(true);
    EXPECT_TRUE(client::run_sync(client_->await_response(a.value(), 2s), 5s));
    EXPECT_TRUE(client::run_sync(client_->await_response(b.value(), 2s), 5s));
    server_->close();
    slow->stop();
}

TEST_F(JsonRpcPeerTest, CancelRequestSetsHandlerFlag) {
    std::atomic<bool> entered{false};
    server_->set_request_handler([&](const RequestContext& ctx, const json&) -> Result<json> {
        entered = true;
        auto deadline = std::chrono::steady_clock::now() + 3s;
        while (!ctx.is_cancelled() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        if (ctx.is_cancelled()) {
            return Error{ErrorCode::OperationCancelled, "cancelled"};
        }
        return json{{"finished", true}};
    });
    server_->start();
    client_->start();

    auto pending = client_->send_request("test/slow", nullptr);
    ASSERT_TRUE(pending);
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return entered.load(); }));
    ASSERT_TRUE(client_->cancel(pending.value().id));

    auto r = client::run_sync(client_->await_response(pending.value(), 5s), 6s);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

TEST_F(JsonRpcPeerTest, ResponseTimeoutForgetsRequest) {
    std::atomic<bool> release{false};
    server_->set_request_handler([&](const RequestContext&, const json&) -> Result<json> {
        bsplink::tests::wait_until([&] { return release.load(); });
        return json(nullptr);
    });
    server_->start();
    client_->start();

    auto r = call("test/hang", nullptr, 100ms);
    release = true;
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_EQ(client_->pending_count(), 0u);
}

TEST_F(JsonRpcPeerTest, PendingRequestsFailWhenPeerCloses) {
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    server_->set_request_handler([&](const RequestContext&, const json&) -> Result<json> {
        entered = true;
        bsplink::tests::wait_until([&] { return release.load(); });
        return json(nullptr);
    });
    std::atomic<int> closes{0};
    client_->set_close_handler([&](const Error& reason) {
        EXPECT_EQ(reason.code, ErrorCode::ConnectionLost);
        closes.fetch_add(1);
    });
    server_->start();
    client_->start();

    auto pending = client_->send_request("test/hang", nullptr);
    ASSERT_TRUE(pending);
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return entered.load(); }));
    server_->close();

    auto r = client::run_sync(client_->await_response(pending.value(), 5s), 6s);
    release = true;
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConnectionLost);
    EXPECT_EQ(closes.load(), 1);

    auto late = client_->send_request("test/late", nullptr);
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code, ErrorCode::ConnectionLost);
}

TEST(JsonRpcPeerBuilders, MessageShapes) {
    auto request = JsonRpcPeer::build_request(7, "build/initialize", json{{"a", 1}});
    EXPECT_EQ(request.at("jsonrpc"), "2.0");
    EXPECT_EQ(request.at("id"), 7);
    EXPECT_EQ(request.at("method"), "build/initialize");

    auto notification = JsonRpcPeer::build_notification("build/exit", nullptr);
    EXPECT_FALSE(notification.contains("id"));
    EXPECT_FALSE(notification.contains("params"));

    auto error = JsonRpcPeer::build_error("abc", -32001, "unknown target");
    EXPECT_EQ(error.at("id"), "abc");
    EXPECT_EQ(error.at("error").at("code"), -32001);
}

} // namespace bsplink::ipc::test
