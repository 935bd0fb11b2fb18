#pragma once

#include <cstdint>
#include <string>

#include <bsplink/core/types.h>

namespace bsplink::ipc {

// Lifecycle of one client/server link. Closed and Failed are terminal: a retry builds a new
// Connection rather than reviving this one. Illegal events are logged and ignored.
//
// Not synchronized; the owning Connection serializes access.
class ConnectionFsm {
public:
    enum class State { Disconnected, Connecting, Handshaking, Ready, Closed, Failed };

    ConnectionFsm() = default;
    ConnectionFsm(const ConnectionFsm&) = delete;
    ConnectionFsm& operator=(const ConnectionFsm&) = delete;

    State state() const noexcept { return state_; }

    // Reason recorded by the transition into Failed.
    const Error& failure() const noexcept { return failure_; }

    bool alive() const noexcept { return state_ != State::Closed && state_ != State::Failed; }
    bool terminal() const noexcept { return !alive(); }
    bool can_write() const noexcept {
        return state_ == State::Handshaking || state_ == State::Ready;
    }

    // Label used in debug logs (endpoint or peer description)
    void set_label(std::string label) { label_ = std::move(label); }

    // Event ingress
    void on_connect_start();
    void on_connected();
    void on_handshake_complete();
    void on_close_request();
    void on_error(Error reason);

    static const char* to_string(State s) noexcept;

private:
    // Returns true if applied, false if illegal/no-op.
    bool transition(State next) noexcept;

    State state_{State::Disconnected};
    Error failure_;
    std::string label_;
};

} // namespace bsplink::ipc
