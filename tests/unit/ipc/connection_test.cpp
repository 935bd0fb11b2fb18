#include <gtest/gtest.h>

#include <bsplink/ipc/connection.h>
#include <bsplink/ipc/transport_failure.h>

#include "common/bsp_test_helpers.h"

#include <mutex>
#include <vector>

#include <unistd.h>

namespace bsplink::ipc::test {

using namespace std::chrono_literals;
using nlohmann::json;

namespace {

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto [stream, fd] = bsplink::tests::make_raw_pair();
        ASSERT_NE(stream, nullptr);
        peerFd_ = fd;
        stream_ = std::move(stream);
    }

    void TearDown() override {
        if (connection_) {
            connection_->close();
        }
        if (peerFd_ >= 0) {
            ::close(peerFd_);
        }
    }

    void start(TransportOptions options = {}) {
        connection_ = Connection::create(std::move(stream_), options);
        connection_->start(
            [this](json message) {
                std::lock_guard<std::mutex> lock(mutex_);
                messages_.push_back(std::move(message));
            },
            [this](const Error& reason) {
                std::lock_guard<std::mutex> lock(mutex_);
                closeReasons_.push_back(reason);
            });
    }

    size_t message_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

    size_t close_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return closeReasons_.size();
    }

    int peerFd_{-1};
    std::unique_ptr<IDuplexStream> stream_;
    std::shared_ptr<Connection> connection_;
    std::mutex mutex_;
    std::vector<json> messages_;
    std::vector<Error> closeReasons_;
};

} // namespace

TEST_F(ConnectionTest, StartsInHandshakingAndBecomesReady) {
    start();
    EXPECT_EQ(connection_->state(), Connection::State::Handshaking);
    connection_->mark_ready();
    EXPECT_TRUE(connection_->ready());
}

TEST_F(ConnectionTest, DeliversFramesInArrivalOrder) {
    start();
    // Two frames in one write, the second split across a later write
    std::string first = MessageFramer::frame(R"({"n":1})");
    std::string second = MessageFramer::frame(R"({"n":2})");
    ASSERT_TRUE(bsplink::tests::write_all(peerFd_, first + second.substr(0, 5)));
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return message_count() == 1; }));
    ASSERT_TRUE(bsplink::tests::write_all(peerFd_, second.substr(5)));
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return message_count() == 2; }));

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(messages_[0].at("n"), 1);
    EXPECT_EQ(messages_[1].at("n"), 2);
}

TEST_F(ConnectionTest, SendWritesFramedMessage) {
    start();
    ASSERT_TRUE(connection_->send(json{{"method", "build/exit"}}));
    auto raw = bsplink::tests::read_until(peerFd_, "build/exit");
    EXPECT_NE(raw.find("Content-Length: "), std::string::npos);
    EXPECT_NE(raw.find("\r\n\r\n{\"method\":\"build/exit\"}"), std::string::npos);
}

TEST_F(ConnectionTest, CorruptFrameFailsWithProtocolError) {
    start();
    ASSERT_TRUE(bsplink::tests::write_all(peerFd_, "Content-Length: abc\r\n\r\n{}"));
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return close_count() == 1; }));

    EXPECT_EQ(connection_->state(), Connection::State::Failed);
    EXPECT_EQ(connection_->failure().code, ErrorCode::ProtocolError);
    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(closeReasons_[0].code, ErrorCode::ConnectionLost);
}

TEST_F(ConnectionTest, NonObjectBodyIsProtocolError) {
    start();
    ASSERT_TRUE(bsplink::tests::write_all(peerFd_, MessageFramer::frame("[1,2,3]")));
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return close_count() == 1; }));
    EXPECT_EQ(connection_->failure().code, ErrorCode::ProtocolError);
    EXPECT_EQ(message_count(), 0u);
}

TEST_F(ConnectionTest, PeerHangupReportsConnectionLostOnce) {
    start();
    ::close(peerFd_);
    peerFd_ = -1;
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return close_count() == 1; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(close_count(), 1u);
    EXPECT_FALSE(connection_->alive());
    EXPECT_EQ(parseTransportFailureKind(connection_->failure().message), TransportFailureKind::Eof);
}

TEST_F(ConnectionTest, CloseIsIdempotentAndFlushesQueuedWrites) {
    start();
    ASSERT_TRUE(connection_->send(json{{"last", true}}));
    connection_->close();
    connection_->close();
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return close_count() == 1; }));
    EXPECT_EQ(connection_->state(), Connection::State::Closed);

    auto raw = bsplink::tests::read_until(peerFd_, "\"last\"");
    EXPECT_NE(raw.find("{\"last\":true}"), std::string::npos);

    auto sent = connection_->send(json{{"late", true}});
    ASSERT_FALSE(sent);
    EXPECT_EQ(sent.error().code, ErrorCode::ConnectionLost);
    EXPECT_EQ(close_count(), 1u);
}

TEST_F(ConnectionTest, IdleTimeoutFailsConnection) {
    TransportOptions options;
    options.idleTimeout = 100ms;
    start(options);
    ASSERT_TRUE(bsplink::tests::wait_until([&] { return close_count() == 1; }, 3s));
    EXPECT_EQ(connection_->state(), Connection::State::Failed);
    EXPECT_EQ(parseTransportFailureKind(connection_->failure().message),
              TransportFailureKind::Timeout);
}

} // namespace bsplink::ipc::test
