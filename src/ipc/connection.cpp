#include <bsplink/core/format.h>
#include <bsplink/ipc/connection.h>
#include <bsplink/ipc/transport_failure.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <span>
#include <vector>

namespace bsplink::ipc {

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using json = nlohmann::json;

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr std::size_t kWriteBatchCap = 256 * 1024;

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

std::shared_ptr<Connection> Connection::create(std::unique_ptr<IDuplexStream> stream,
                                               TransportOptions options) {
    return std::shared_ptr<Connection>(new Connection(std::move(stream), std::move(options)));
}

Connection::Connection(std::unique_ptr<IDuplexStream> stream, TransportOptions options)
    : stream_(std::move(stream)), options_(std::move(options)),
      executor_(stream_->get_executor()), description_(stream_->describe()),
      reader_(options_.maxFrameBytes) {
    fsm_.set_label(description_);
    fsm_.on_connect_start();
    fsm_.on_connected();
    touch();
}

Connection::~Connection() {
    stream_->close();
}

void Connection::start(MessageSink onMessage, CloseSink onClosed) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        onMessage_ = std::move(onMessage);
        onClosed_ = std::move(onClosed);
    }
    auto self = shared_from_this();
    boost::asio::co_spawn(
        executor_, [self]() { return self->read_loop(); }, boost::asio::detached);
    if (options_.idleTimeout.count() > 0) {
        boost::asio::co_spawn(
            executor_, [self]() { return self->idle_watchdog(); }, boost::asio::detached);
    }
}

Result<void> Connection::send(const json& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fsm_.can_write()) {
            auto reason = fsm_.state() == State::Failed ? fsm_.failure().message
                                                        : std::string("connection closed");
            return Error{ErrorCode::ConnectionLost,
                         bsplink::format("cannot send on {}: {}", description_, reason)};
        }
    }

    std::string frame;
    try {
        frame = MessageFramer::frame(message.dump());
    } catch (const json::exception& e) {
        return Error{ErrorCode::ProtocolError, bsplink::format("cannot encode message: {}", e.what())};
    }

    auto self = shared_from_this();
    boost::asio::post(executor_, [self, frame = std::move(frame)]() mutable {
        if (self->closeRequested_) {
            return;
        }
        self->write_queue_.push_back(std::move(frame));
        if (self->writing_) {
            return;
        }
        self->writing_ = true;
        boost::asio::co_spawn(
            self->executor_, [self]() { return self->write_pump(); }, boost::asio::detached);
    });
    return Result<void>();
}

awaitable<void> Connection::write_pump() {
    while (!write_queue_.empty()) {
        std::string batch;
        while (!write_queue_.empty() && batch.size() < kWriteBatchCap) {
            batch.append(write_queue_.front());
            write_queue_.pop_front();
        }
        auto written = co_await stream_->async_write_all(batch);
        if (!written) {
            writing_ = false;
            write_queue_.clear();
            if (closeRequested_) {
                finish_close();
            } else {
                fail(written.error());
            }
            co_return;
        }
        touch();
    }
    writing_ = false;
    if (closeRequested_) {
        finish_close();
    }
}

awaitable<void> Connection::read_loop() {
    std::vector<char> buffer(kReadChunk);
    while (true) {
        auto n = co_await stream_->async_read_some(std::span<char>(buffer.data(), buffer.size()));
        if (!n) {
            // No-op when the connection was already closed or failed locally
            fail(n.error());
            co_return;
        }
        touch();
        reader_.append(std::span<const char>(buffer.data(), n.value()));

        while (true) {
            auto frame = reader_.try_read_frame();
            if (!frame) {
                fail(frame.error());
                co_return;
            }
            if (!frame.value()) {
                break;
            }
            json message = json::parse(*frame.value(), nullptr, false);
            if (message.is_discarded() || !message.is_object()) {
                fail(Error{ErrorCode::ProtocolError,
                           bsplink::format("invalid JSON-RPC message on {}", description_)});
                co_return;
            }
            MessageSink sink;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!fsm_.alive()) {
                    co_return;
                }
                sink = onMessage_;
            }
            if (sink) {
                try {
                    sink(std::move(message));
                } catch (const std::exception& e) {
                    spdlog::error("Connection {}: message handler threw: {}", description_,
                                  e.what());
                }
            }
        }
    }
}

awaitable<void> Connection::idle_watchdog() {
    auto idle = options_.idleTimeout;
    auto interval = std::clamp(idle / 4, std::chrono::milliseconds(10), std::chrono::milliseconds(1000));
    boost::asio::steady_timer timer(executor_);
    while (alive()) {
        timer.expires_after(interval);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        if (!alive()) {
            co_return;
        }
        if (now_ms() - lastActivityMs_.load(std::memory_order_relaxed) > idle.count()) {
            fail(transportError(TransportFailureKind::Timeout,
                                bsplink::format("idle for more than {}ms ({})", idle.count(),
                                                description_)));
            co_return;
        }
    }
}

void Connection::mark_ready() {
    std::lock_guard<std::mutex> lock(mutex_);
    fsm_.on_handshake_complete();
}

void Connection::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fsm_.terminal()) {
            return;
        }
        fsm_.on_close_request();
    }
    auto self = shared_from_this();
    boost::asio::post(executor_, [self]() {
        self->closeRequested_ = true;
        if (!self->writing_) {
            self->finish_close();
        }
    });
}

void Connection::finish_close() {
    stream_->close();
    notify_closed(Error{ErrorCode::ConnectionLost,
                        bsplink::format("connection closed ({})", description_)});
}

void Connection::fail(Error reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fsm_.terminal()) {
            return;
        }
        fsm_.on_error(reason);
    }
    spdlog::debug("Connection {} failed: {}", description_, reason.message);
    stream_->close();
    if (reason.code != ErrorCode::ConnectionLost) {
        reason = Error{ErrorCode::ConnectionLost, reason.message};
    }
    notify_closed(reason);
}

void Connection::notify_closed(const Error& reason) {
    if (closeNotified_.exchange(true)) {
        return;
    }
    CloseSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = std::move(onClosed_);
        onMessage_ = nullptr;
    }
    if (sink) {
        sink(reason);
    }
}

Connection::State Connection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fsm_.state();
}

bool Connection::alive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fsm_.alive();
}

Error Connection::failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fsm_.failure();
}

void Connection::touch() noexcept {
    lastActivityMs_.store(now_ms(), std::memory_order_relaxed);
}

awaitable<Result<std::shared_ptr<Connection>>> open_connection(const TransportEndpoint& endpoint,
                                                               const TransportOptions& options) {
    auto stream = co_await open_stream(endpoint, options);
    if (!stream) {
        co_return stream.error();
    }
    co_return Connection::create(std::move(stream).value(), options);
}

} // namespace bsplink::ipc
