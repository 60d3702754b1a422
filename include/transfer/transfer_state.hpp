#ifndef SEVAULT_TRANSFER_TRANSFER_STATE_HPP
#define SEVAULT_TRANSFER_TRANSFER_STATE_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace sevault {
namespace transfer {

enum class Direction {
    STORE,
    READ
};

/**
 * Mutable state of one chunked operation.
 *
 * Store: IDLE -> INIT -> CONTINUING* -> FINALIZED
 * Read:  IDLE -> INIT -> DRAINING*   -> FINALIZED
 *
 * Any non-terminal phase may move to ABORTED. FINALIZED and ABORTED
 * are terminal; a new operation needs a new TransferState.
 */
class TransferState {
public:
    enum class Phase {
        IDLE,
        INIT,
        CONTINUING,
        DRAINING,
        FINALIZED,
        ABORTED
    };

    explicit TransferState(Direction direction)
        : direction_(direction), phase_(Phase::IDLE), bytes_transferred_(0) {}

    Direction direction() const { return direction_; }
    Phase phase() const { return phase_; }
    std::size_t bytes_transferred() const { return bytes_transferred_; }
    // Known for reads once INIT reported it
    std::optional<std::size_t> total_length() const { return total_length_; }

    /**
     * Attempt to move to a new phase.
     * @return false and leave the phase unchanged if the move is not allowed
     */
    bool transition_to(Phase new_phase) {
        if (!is_valid_transition(direction_, phase_, new_phase)) {
            return false;
        }
        phase_ = new_phase;
        return true;
    }

    static bool is_valid_transition(Direction direction, Phase from, Phase to) {
        if (to == Phase::ABORTED) {
            return from != Phase::FINALIZED && from != Phase::ABORTED;
        }

        // Phase reached while data moves in this direction
        const Phase moving = direction == Direction::STORE ? Phase::CONTINUING : Phase::DRAINING;

        switch (from) {
            case Phase::IDLE:
                return to == Phase::INIT;

            case Phase::INIT:
                return to == moving ||
                       to == Phase::FINALIZED;

            case Phase::CONTINUING:
            case Phase::DRAINING:
                return from == moving &&
                       (to == moving || to == Phase::FINALIZED);

            case Phase::FINALIZED:
            case Phase::ABORTED:
                return false;
        }
        return false;
    }

    void add_bytes(std::size_t count) { bytes_transferred_ += count; }
    void set_total_length(std::size_t total) { total_length_ = total; }

    bool is_terminal() const {
        return phase_ == Phase::FINALIZED || phase_ == Phase::ABORTED;
    }

    // CONTINUE is legal once INIT succeeded and until FINALIZE
    bool accepts_continue() const {
        return phase_ == Phase::INIT ||
               phase_ == Phase::CONTINUING ||
               phase_ == Phase::DRAINING;
    }

    bool accepts_finalize() const { return accepts_continue(); }

    static std::string phase_to_string(Phase phase) {
        switch (phase) {
            case Phase::IDLE:       return "IDLE";
            case Phase::INIT:       return "INIT";
            case Phase::CONTINUING: return "CONTINUING";
            case Phase::DRAINING:   return "DRAINING";
            case Phase::FINALIZED:  return "FINALIZED";
            case Phase::ABORTED:    return "ABORTED";
            default:                return "UNKNOWN";
        }
    }

    std::string get_phase_string() const {
        return phase_to_string(phase_);
    }

private:
    Direction direction_;
    Phase phase_;
    std::size_t bytes_transferred_;
    std::optional<std::size_t> total_length_;
};

inline std::ostream& operator<<(std::ostream& os, const Direction& direction) {
    os << (direction == Direction::STORE ? "STORE" : "READ");
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const TransferState::Phase& phase) {
    os << TransferState::phase_to_string(phase);
    return os;
}

} // namespace transfer
} // namespace sevault

#endif // SEVAULT_TRANSFER_TRANSFER_STATE_HPP
