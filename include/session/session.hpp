#ifndef SEVAULT_SESSION_SESSION_HPP
#define SEVAULT_SESSION_SESSION_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config/client_config.hpp"
#include "crypto/signature_provider.hpp"
#include "record/authorization.hpp"
#include "record/fixed_record.hpp"
#include "record/record_key.hpp"
#include "session/operation_result.hpp"
#include "transfer/transfer_engine.hpp"
#include "transfer/transfer_state.hpp"
#include "transport/transport.hpp"

namespace sevault {
namespace session {

/**
 * Owns the single active TransferState for one channel and turns every
 * failure into an OperationResult.
 *
 * Out-of-order calls are refused before anything reaches the transport.
 * After CONNECTION_UNAVAILABLE the session stays unusable until reset().
 */
class Session {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // The configuration is copied so it cannot change under an active transfer
  Session(transport::Transport& transport, std::shared_ptr<crypto::SignatureProvider> signer,
          const config::ClientConfig& config);
  ~Session() = default;

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;


  // ---- STORE (PHASED) ----
  OperationResult begin_store(const record::RecordKey& key);
  OperationResult continue_store(const std::vector<uint8_t>& payload);
  OperationResult finalize_store();


  // ---- READ (PHASED) ----
  OperationResult begin_read(const record::RecordKey& key);
  // Ok(bytes received by this call)
  OperationResult continue_read();
  // Ok(whole record), also when the card only warned on FINALIZE
  OperationResult finalize_read();


  // ---- FULL SEQUENCES ----
  OperationResult store(const record::RecordKey& key, const std::vector<uint8_t>& payload);
  OperationResult read(const record::RecordKey& key);


  // ---- FIXED-LENGTH RECORDS ----
  // Ok([record_index, record_count])
  OperationResult store_fixed(const std::string& username, const std::string& address,
                              const std::vector<uint8_t>& message);
  // Ok(message with trailing zeros stripped)
  OperationResult read_fixed(const std::string& username, const std::string& address);
  // Ok([deleted_index, remaining_count])
  OperationResult remove_fixed(const std::string& username, const std::string& address);


  // ---- CONTROL ----
  // Drops client-side state only, the card is not told
  void abort();
  // Clears all state and makes the session usable again
  void reset();


  // ---- GETTERS ----
  bool has_active_operation() const;
  std::optional<transfer::TransferState> active_state() const;
  bool is_usable() const;
  const config::ClientConfig& get_config() const { return config_; }

private:
  // ---- PARAMETERS ----
  transport::Transport& transport_;
  const config::ClientConfig config_;
  record::Authorizer authorizer_;
  transfer::TransferEngine engine_;
  record::FixedRecordClient fixed_client_;

  std::optional<transfer::TransferState> active_;
  std::vector<uint8_t> read_buffer_;
  bool usable_;
  mutable std::mutex mutex_;


  // ---- UNLOCKED OPERATIONS ----
  OperationResult begin_store_unlocked(const record::RecordKey& key);
  OperationResult continue_store_unlocked(const std::vector<uint8_t>& payload);
  OperationResult finalize_store_unlocked();
  OperationResult begin_read_unlocked(const record::RecordKey& key);
  OperationResult continue_read_unlocked();
  OperationResult finalize_read_unlocked();


  // ---- ERROR BOUNDARY ----
  // Runs body, converting any exception into Err
  OperationResult run_guarded(const char* operation, const std::function<OperationResult()>& body);
  OperationResult fail(const char* operation, protocol::ErrorKind kind,
                       std::optional<uint16_t> status_code, const std::string& message);
  OperationResult refuse_if_active(const char* operation) const;
  OperationResult refuse_if_idle(const char* operation) const;
};

} // namespace session
} // namespace sevault

#endif // SEVAULT_SESSION_SESSION_HPP
