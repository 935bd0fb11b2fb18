#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <bsplink/core/types.h>
#include <bsplink/ipc/connection_fsm.h>
#include <bsplink/ipc/duplex_stream.h>
#include <bsplink/ipc/endpoint.h>
#include <bsplink/ipc/message_framing.h>
#include <bsplink/ipc/transport_options.h>

namespace bsplink::ipc {

// A framed JSON message channel over one duplex stream.
//
// One read loop runs on the stream's strand and hands every decoded message to the message
// sink in arrival order. Writes are queued and flushed by a single writer on the same strand.
// The first failure (read error, corrupt frame, write error, idle timeout) moves the
// connection to Failed, closes the stream and reports the reason to the close sink exactly
// once.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using State = ConnectionFsm::State;
    using MessageSink = std::function<void(nlohmann::json message)>;
    using CloseSink = std::function<void(const Error& reason)>;

    static std::shared_ptr<Connection> create(std::unique_ptr<IDuplexStream> stream,
                                              TransportOptions options = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Begin reading. Sinks are invoked on the connection's strand and must not block.
    void start(MessageSink onMessage, CloseSink onClosed);

    // Frame and enqueue a message. Fails with ConnectionLost once the connection is terminal.
    Result<void> send(const nlohmann::json& message);

    // Handshake completed: Handshaking -> Ready.
    void mark_ready();

    // Graceful close: queued writes are flushed, then the stream is closed. -> Closed
    void close();

    // Abort with a reason. -> Failed
    void fail(Error reason);

    State state() const;
    bool alive() const;
    bool ready() const { return state() == State::Ready; }
    // Reason of the transition into Failed (code Success otherwise)
    Error failure() const;

    std::string describe() const { return description_; }
    boost::asio::any_io_executor get_executor() const { return executor_; }
    const TransportOptions& options() const noexcept { return options_; }

private:
    Connection(std::unique_ptr<IDuplexStream> stream, TransportOptions options);

    boost::asio::awaitable<void> read_loop();
    boost::asio::awaitable<void> write_pump();
    boost::asio::awaitable<void> idle_watchdog();

    void finish_close();
    void notify_closed(const Error& reason);
    void touch() noexcept;

    std::unique_ptr<IDuplexStream> stream_;
    TransportOptions options_;
    boost::asio::any_io_executor executor_;
    std::string description_;
    FrameReader reader_;

    mutable std::mutex mutex_;
    ConnectionFsm fsm_;
    MessageSink onMessage_;
    CloseSink onClosed_;
    std::atomic<bool> closeNotified_{false};
    std::atomic<int64_t> lastActivityMs_{0};

    // Strand-confined
    std::deque<std::string> write_queue_;
    bool writing_{false};
    bool closeRequested_{false};
};

// Connect to an endpoint and wrap the stream. The returned connection is in Handshaking and
// not yet reading; call start().
boost::asio::awaitable<Result<std::shared_ptr<Connection>>>
open_connection(const TransportEndpoint& endpoint, const TransportOptions& options);

} // namespace bsplink::ipc
