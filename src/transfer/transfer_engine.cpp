#include "transfer/transfer_engine.hpp"
#include "protocol/codec.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/status.hpp"
#include "transport/exchange.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace sevault {
namespace transfer {

using protocol::ErrorKind;
using protocol::ProtocolError;
using protocol::StatusOutcome;

TransferEngine::TransferEngine(transport::Transport& transport, const config::ClientConfig& config)
  : transport_(transport)
  , config_(config) {
  config_.validate();
}


//==============================================
// STORE DIRECTION
//==============================================

TransferState TransferEngine::begin_store(const record::RecordKey& key) {
  TransferState state(Direction::STORE);

  protocol::CommandFrame command = make_command(config_.store_ins.init);
  command.data = key.wire_encoding();

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Store INIT for " << key;
  protocol::ResponseFrame response = transport::exchange(transport_, command);
  StatusOutcome outcome = StatusOutcome::classify(response.sw1, response.sw2);
  if (!outcome.is_success()) {
    abort(state, ErrorKind::INIT_REJECTED, "Store INIT rejected", outcome.code());
  }

  state.transition_to(TransferState::Phase::INIT);
  return state;
}

void TransferEngine::continue_store(TransferState& state, const std::vector<uint8_t>& payload) {
  require(state, Direction::STORE, state.accepts_continue(), "CONTINUE");

  const std::size_t chunk_size = config_.store_chunk_size;
  std::size_t offset = 0;

  while (offset < payload.size()) {
    std::size_t length = std::min(chunk_size, payload.size() - offset);

    protocol::CommandFrame command = make_command(config_.store_ins.cont);
    command.data.assign(payload.begin() + offset, payload.begin() + offset + length);

    protocol::ResponseFrame response = exchange_in(state, command);
    StatusOutcome outcome = StatusOutcome::classify(response.sw1, response.sw2);
    if (!outcome.is_success()) {
      abort(state, ErrorKind::CHUNK_REJECTED,
            "Store chunk at offset " + std::to_string(state.bytes_transferred()) + " rejected",
            outcome.code());
    }

    state.transition_to(TransferState::Phase::CONTINUING);
    state.add_bytes(length);
    offset += length;

    BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Sent chunk of " << length << " bytes, "
                             << state.bytes_transferred() << " total";
  }
}

void TransferEngine::finalize_store(TransferState& state) {
  require(state, Direction::STORE, state.accepts_finalize(), "FINALIZE");

  // Empty payload, sent as the bare header
  protocol::CommandFrame command = make_command(config_.store_ins.finalize);

  protocol::ResponseFrame response = exchange_in(state, command);
  StatusOutcome outcome = StatusOutcome::classify(response.sw1, response.sw2);
  if (!outcome.is_success()) {
    abort(state, ErrorKind::FINALIZE_FAILED, "Store FINALIZE failed", outcome.code());
  }

  state.transition_to(TransferState::Phase::FINALIZED);
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Store committed, " << state.bytes_transferred() << " bytes";
}


//==============================================
// READ DIRECTION
//==============================================

TransferState TransferEngine::begin_read(const record::AuthorizationEnvelope& envelope) {
  TransferState state(Direction::READ);

  protocol::CommandFrame command = make_command(config_.read_ins.init);
  command.data = envelope.wire_encoding();

  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Read INIT for " << envelope.key
                          << (envelope.has_signature() ? " (signed)" : " (unsigned)");
  protocol::ResponseFrame response = transport::exchange(transport_, command);
  StatusOutcome outcome = StatusOutcome::classify(response.sw1, response.sw2);
  if (!outcome.is_success()) {
    // Not found and bad signature are deliberately not told apart here
    abort(state, ErrorKind::INIT_REJECTED, "Read INIT rejected", outcome.code());
  }

  if (response.data.size() < 2) {
    state.transition_to(TransferState::Phase::ABORTED);
    throw ProtocolError(ErrorKind::MALFORMED_RESPONSE,
                        "Read INIT response carries " + std::to_string(response.data.size()) +
                        " bytes, expected a 2-byte length");
  }

  state.transition_to(TransferState::Phase::INIT);
  state.set_total_length(protocol::Codec::read_u16_be(response.data, 0));
  BOOST_LOG_TRIVIAL(info) << "Transfer engine: Record length " << *state.total_length() << " bytes";
  return state;
}

std::vector<uint8_t> TransferEngine::continue_read(TransferState& state) {
  require(state, Direction::READ, state.accepts_continue(), "CONTINUE");

  const std::size_t total = state.total_length().value_or(0);
  std::vector<uint8_t> collected;
  collected.reserve(total);

  bool final_chunk = false;
  while (!final_chunk && state.bytes_transferred() < total) {
    protocol::CommandFrame command = make_command(config_.read_ins.cont);
    command.expected_length = config_.read_expected_length;

    protocol::ResponseFrame response = exchange_in(state, command);
    StatusOutcome outcome = StatusOutcome::classify(response.sw1, response.sw2);

    switch (outcome.kind()) {
      case protocol::StatusKind::SUCCESS:
        final_chunk = true;
        break;

      case protocol::StatusKind::MORE_DATA:
        if (response.data.empty()) {
          state.transition_to(TransferState::Phase::ABORTED);
          throw ProtocolError(ErrorKind::MALFORMED_RESPONSE,
                              "More-data response without data", outcome.code());
        }
        BOOST_LOG_TRIVIAL(trace) << "Transfer engine: Card hints " << static_cast<int>(outcome.remaining_hint())
                                 << " bytes remaining";
        break;

      case protocol::StatusKind::FAILURE:
        abort(state, ErrorKind::CHUNK_REJECTED,
              "Read chunk at offset " + std::to_string(state.bytes_transferred()) + " rejected",
              outcome.code());
    }

    collected.insert(collected.end(), response.data.begin(), response.data.end());
    state.transition_to(TransferState::Phase::DRAINING);
    state.add_bytes(response.data.size());

    BOOST_LOG_TRIVIAL(debug) << "Transfer engine: Received " << state.bytes_transferred() << "/" << total << " bytes";
  }

  if (state.bytes_transferred() != total) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Collected " << state.bytes_transferred()
                               << " bytes, card reported " << total;
  }
  return collected;
}

bool TransferEngine::finalize_read(TransferState& state) {
  require(state, Direction::READ, state.accepts_finalize(), "FINALIZE");

  protocol::CommandFrame command = make_command(config_.read_ins.finalize);

  protocol::ResponseFrame response = exchange_in(state, command);
  StatusOutcome outcome = StatusOutcome::classify(response.sw1, response.sw2);

  // The card may already have reset after the last chunk
  state.transition_to(TransferState::Phase::FINALIZED);
  if (!outcome.is_success()) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer engine: Read FINALIZE answered "
                               << protocol::format_status(outcome.code()) << " ("
                               << protocol::describe_status(outcome.code()) << "), keeping collected data";
    return false;
  }
  return true;
}


//==============================================
// HELPERS
//==============================================

protocol::CommandFrame TransferEngine::make_command(uint8_t ins) const {
  protocol::CommandFrame command;
  command.cla = config_.cla;
  command.ins = ins;
  return command;
}

void TransferEngine::require(const TransferState& state, Direction direction, bool phase_ok,
                             const char* step) const {
  if (state.direction() != direction || !phase_ok) {
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: " << step << " refused for " << state.direction()
                             << " operation in phase " << state.phase();
    throw ProtocolError(ErrorKind::NO_ACTIVE_OPERATION,
                        std::string(step) + " without an active operation in that direction");
  }
}

protocol::ResponseFrame TransferEngine::exchange_in(TransferState& state, const protocol::CommandFrame& command) {
  try {
    return transport::exchange(transport_, command);
  }
  catch (const ProtocolError& e) {
    // Any failure past INIT ends the operation
    state.transition_to(TransferState::Phase::ABORTED);
    BOOST_LOG_TRIVIAL(error) << "Transfer engine: " << state.direction() << " operation aborted after "
                             << state.bytes_transferred() << " bytes: " << e.what();
    throw;
  }
}

void TransferEngine::abort(TransferState& state, ErrorKind kind, const std::string& message, uint16_t status) {
  state.transition_to(TransferState::Phase::ABORTED);
  BOOST_LOG_TRIVIAL(error) << "Transfer engine: " << message << " with " << protocol::format_status(status)
                           << " (" << protocol::describe_status(status) << ")";
  throw ProtocolError(kind, message, status);
}

} // namespace transfer
} // namespace sevault
