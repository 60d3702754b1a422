#ifndef SEVAULT_TRANSPORT_CONNECTION_STATE_HPP
#define SEVAULT_TRANSPORT_CONNECTION_STATE_HPP

#include <ostream>
#include <string>

namespace sevault {
namespace transport {

/**
 * Lifecycle of the link to a card reader relay.
 * CLOSED     - no socket, may start connecting
 * CONNECTING - resolving and connecting
 * OPEN       - exchanges may be sent
 * BROKEN     - an I/O error occurred mid-exchange; only closing is allowed
 */
class ConnectionState {
public:
    enum class State {
        CLOSED,
        CONNECTING,
        OPEN,
        BROKEN
    };

    ConnectionState() : current_state_(State::CLOSED) {}

    State get_state() const { return current_state_; }

    bool is_open() const { return current_state_ == State::OPEN; }

    /**
     * Attempt to move to a new state.
     * @return false and leave the state unchanged if the move is not allowed
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::CLOSED:
                return to == State::CONNECTING;

            case State::CONNECTING:
                return to == State::OPEN ||
                       to == State::CLOSED;

            case State::OPEN:
                return to == State::BROKEN ||
                       to == State::CLOSED;

            case State::BROKEN:
                return to == State::CLOSED;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::CLOSED:     return "CLOSED";
            case State::CONNECTING: return "CONNECTING";
            case State::OPEN:       return "OPEN";
            case State::BROKEN:     return "BROKEN";
            default:                return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

inline std::ostream& operator<<(std::ostream& os, const ConnectionState::State& state) {
    os << ConnectionState::state_to_string(state);
    return os;
}

} // namespace transport
} // namespace sevault

#endif // SEVAULT_TRANSPORT_CONNECTION_STATE_HPP
