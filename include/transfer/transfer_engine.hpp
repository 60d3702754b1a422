#ifndef SEVAULT_TRANSFER_TRANSFER_ENGINE_HPP
#define SEVAULT_TRANSFER_TRANSFER_ENGINE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "config/client_config.hpp"
#include "protocol/apdu_frame.hpp"
#include "protocol/protocol_error.hpp"
#include "record/authorization.hpp"
#include "record/record_key.hpp"
#include "transfer/transfer_state.hpp"
#include "transport/transport.hpp"

namespace sevault {
namespace transfer {

/**
 * Drives INIT -> CONTINUE* -> FINALIZE for both directions.
 *
 * The engine holds no per-operation state of its own: every call takes the
 * TransferState it advances. Failures throw ProtocolError and move the state
 * to ABORTED, after which no further exchange is made for that operation.
 */
class TransferEngine {
public:
  // Throws std::invalid_argument when config does not validate
  TransferEngine(transport::Transport& transport, const config::ClientConfig& config);

  // ---- STORE DIRECTION ----
  // INIT with [len][username][len][address], throws INIT_REJECTED
  TransferState begin_store(const record::RecordKey& key);
  // One CONTINUE per chunk of at most store_chunk_size bytes, throws CHUNK_REJECTED.
  // May be called several times before finalize_store.
  void continue_store(TransferState& state, const std::vector<uint8_t>& payload);
  // FINALIZE with an empty payload, throws FINALIZE_FAILED
  void finalize_store(TransferState& state);


  // ---- READ DIRECTION ----
  // INIT with key fields and signature; response carries the big-endian total length
  TransferState begin_read(const record::AuthorizationEnvelope& envelope);
  // Drains CONTINUE responses until SUCCESS or the reported total is reached
  std::vector<uint8_t> continue_read(TransferState& state);
  // Advisory, returns false when the card answered with a non-success status
  bool finalize_read(TransferState& state);

private:
  protocol::CommandFrame make_command(uint8_t ins) const;
  void require(const TransferState& state, Direction direction, bool phase_ok, const char* step) const;
  // Exchange for an operation already past INIT; any ProtocolError aborts the state
  protocol::ResponseFrame exchange_in(TransferState& state, const protocol::CommandFrame& command);
  void abort(TransferState& state, protocol::ErrorKind kind, const std::string& message, uint16_t status);

  transport::Transport& transport_;
  const config::ClientConfig& config_;
};

} // namespace transfer
} // namespace sevault

#endif // SEVAULT_TRANSFER_TRANSFER_ENGINE_HPP
