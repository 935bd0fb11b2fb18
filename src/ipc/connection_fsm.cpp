#include <bsplink/ipc/connection_fsm.h>

#include <spdlog/spdlog.h>

namespace bsplink::ipc {

bool ConnectionFsm::transition(State next) noexcept {
    if (state_ == next)
        return false;
    auto from = state_;
    auto legal = [from, next]() noexcept -> bool {
        using S = ConnectionFsm::State;
        switch (from) {
            case S::Disconnected:
                return (next == S::Connecting || next == S::Closed || next == S::Failed);
            case S::Connecting:
                return (next == S::Handshaking || next == S::Closed || next == S::Failed);
            case S::Handshaking:
                return (next == S::Ready || next == S::Closed || next == S::Failed);
            case S::Ready:
                return (next == S::Closed || next == S::Failed);
            case S::Closed:
            case S::Failed:
                return false;
        }
        return false;
    }();

    if (!legal) {
        spdlog::debug("ConnectionFsm: illegal transition {} -> {} ({})", to_string(from),
                      to_string(next), label_);
        return false;
    }
    spdlog::debug("ConnectionFsm: {} -> {} ({})", to_string(from), to_string(next), label_);
    state_ = next;
    return true;
}

void ConnectionFsm::on_connect_start() {
    transition(State::Connecting);
}

void ConnectionFsm::on_connected() {
    transition(State::Handshaking);
}

void ConnectionFsm::on_handshake_complete() {
    transition(State::Ready);
}

void ConnectionFsm::on_close_request() {
    transition(State::Closed);
}

void ConnectionFsm::on_error(Error reason) {
    if (transition(State::Failed)) {
        failure_ = std::move(reason);
    }
}

const char* ConnectionFsm::to_string(State s) noexcept {
    switch (s) {
        case State::Disconnected:
            return "Disconnected";
        case State::Connecting:
            return "Connecting";
        case State::Handshaking:
            return "Handshaking";
        case State::Ready:
            return "Ready";
        case State::Closed:
            return "Closed";
        case State::Failed:
            return "Failed";
    }
    return "Unknown";
}

} // namespace bsplink::ipc
