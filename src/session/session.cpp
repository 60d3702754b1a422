#include "session/session.hpp"
#include "crypto/crypto_error.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/status.hpp"
#include <boost/log/trivial.hpp>

namespace sevault {
namespace session {

using protocol::ErrorKind;

Session::Session(transport::Transport& transport, std::shared_ptr<crypto::SignatureProvider> signer,
                 const config::ClientConfig& config)
  : transport_(transport)
  , config_(config)
  , authorizer_(std::move(signer), config_.digest_policy)
  , engine_(transport_, config_)
  , fixed_client_(transport_, authorizer_, config_)
  , usable_(true) {
  BOOST_LOG_TRIVIAL(debug) << "Session: Created (chunk size " << config_.store_chunk_size
                           << ", digest policy " << config::to_string(config_.digest_policy) << ")";
}


//==============================================
// STORE (PHASED)
//==============================================

OperationResult Session::begin_store(const record::RecordKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return begin_store_unlocked(key);
}

OperationResult Session::continue_store(const std::vector<uint8_t>& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  return continue_store_unlocked(payload);
}

OperationResult Session::finalize_store() {
  std::lock_guard<std::mutex> lock(mutex_);
  return finalize_store_unlocked();
}


//==============================================
// READ (PHASED)
//==============================================

OperationResult Session::begin_read(const record::RecordKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return begin_read_unlocked(key);
}

OperationResult Session::continue_read() {
  std::lock_guard<std::mutex> lock(mutex_);
  return continue_read_unlocked();
}

OperationResult Session::finalize_read() {
  std::lock_guard<std::mutex> lock(mutex_);
  return finalize_read_unlocked();
}


//==============================================
// FULL SEQUENCES
//==============================================

OperationResult Session::store(const record::RecordKey& key, const std::vector<uint8_t>& payload) {
  std::lock_guard<std::mutex> lock(mutex_);

  OperationResult result = begin_store_unlocked(key);
  if (!result) {
    return result;
  }
  result = continue_store_unlocked(payload);
  if (!result) {
    return result;
  }
  return finalize_store_unlocked();
}

OperationResult Session::read(const record::RecordKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  OperationResult result = begin_read_unlocked(key);
  if (!result) {
    return result;
  }
  result = continue_read_unlocked();
  if (!result) {
    return result;
  }
  return finalize_read_unlocked();
}


//==============================================
// FIXED-LENGTH RECORDS
//==============================================

OperationResult Session::store_fixed(const std::string& username, const std::string& address,
                                     const std::vector<uint8_t>& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  return run_guarded("fixed store", [&]() {
    OperationResult refused = refuse_if_active("fixed store");
    if (!refused) {
      return refused;
    }
    record::StoreReceipt receipt = fixed_client_.store(username, address, message);
    return OperationResult::ok({receipt.record_index, receipt.record_count});
  });
}

OperationResult Session::read_fixed(const std::string& username, const std::string& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  return run_guarded("fixed read", [&]() {
    OperationResult refused = refuse_if_active("fixed read");
    if (!refused) {
      return refused;
    }
    return OperationResult::ok(fixed_client_.read(username, address));
  });
}

OperationResult Session::remove_fixed(const std::string& username, const std::string& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  return run_guarded("fixed delete", [&]() {
    OperationResult refused = refuse_if_active("fixed delete");
    if (!refused) {
      return refused;
    }
    record::DeleteReceipt receipt = fixed_client_.remove(username, address);
    return OperationResult::ok({receipt.deleted_index, receipt.remaining_count});
  });
}


//==============================================
// CONTROL AND GETTERS
//==============================================

void Session::abort() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_) {
    BOOST_LOG_TRIVIAL(info) << "Session: Abandoning " << active_->direction() << " operation in phase "
                            << active_->phase() << " after " << active_->bytes_transferred() << " bytes";
  }
  active_.reset();
  read_buffer_.clear();
}

void Session::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  active_.reset();
  read_buffer_.clear();
  usable_ = true;
  BOOST_LOG_TRIVIAL(info) << "Session: Reset";
}

bool Session::has_active_operation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.has_value();
}

std::optional<transfer::TransferState> Session::active_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

bool Session::is_usable() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return usable_;
}


//==============================================
// UNLOCKED OPERATIONS
//==============================================

OperationResult Session::begin_store_unlocked(const record::RecordKey& key) {
  return run_guarded("begin store", [&]() {
    OperationResult refused = refuse_if_active("begin store");
    if (!refused) {
      return refused;
    }
    active_ = engine_.begin_store(key);
    return OperationResult::ok();
  });
}

OperationResult Session::continue_store_unlocked(const std::vector<uint8_t>& payload) {
  return run_guarded("continue store", [&]() {
    OperationResult refused = refuse_if_idle("continue store");
    if (!refused) {
      return refused;
    }
    engine_.continue_store(*active_, payload);
    return OperationResult::ok();
  });
}

OperationResult Session::finalize_store_unlocked() {
  return run_guarded("finalize store", [&]() {
    OperationResult refused = refuse_if_idle("finalize store");
    if (!refused) {
      return refused;
    }
    engine_.finalize_store(*active_);
    active_.reset();
    return OperationResult::ok();
  });
}

OperationResult Session::begin_read_unlocked(const record::RecordKey& key) {
  return run_guarded("begin read", [&]() {
    OperationResult refused = refuse_if_active("begin read");
    if (!refused) {
      return refused;
    }
    // Signing happens before any exchange, a CryptoError stops here
    record::AuthorizationEnvelope envelope = authorizer_.authorize(key);
    active_ = engine_.begin_read(envelope);
    read_buffer_.clear();
    return OperationResult::ok();
  });
}

OperationResult Session::continue_read_unlocked() {
  return run_guarded("continue read", [&]() {
    OperationResult refused = refuse_if_idle("continue read");
    if (!refused) {
      return refused;
    }
    std::vector<uint8_t> chunk = engine_.continue_read(*active_);
    read_buffer_.insert(read_buffer_.end(), chunk.begin(), chunk.end());
    return OperationResult::ok(std::move(chunk));
  });
}

OperationResult Session::finalize_read_unlocked() {
  return run_guarded("finalize read", [&]() {
    OperationResult refused = refuse_if_idle("finalize read");
    if (!refused) {
      return refused;
    }
    engine_.finalize_read(*active_);
    std::vector<uint8_t> payload = std::move(read_buffer_);
    read_buffer_.clear();
    active_.reset();
    BOOST_LOG_TRIVIAL(info) << "Session: Read complete, " << payload.size() << " bytes";
    return OperationResult::ok(std::move(payload));
  });
}


//==============================================
// ERROR BOUNDARY
//==============================================

OperationResult Session::run_guarded(const char* operation, const std::function<OperationResult()>& body) {
  if (!usable_) {
    BOOST_LOG_TRIVIAL(warning) << "Session: " << operation << " refused, channel lost and not reset";
    return OperationResult::err(ErrorKind::CONNECTION_UNAVAILABLE, std::nullopt,
                                "Session is unusable until reset");
  }

  try {
    return body();
  }
  catch (const protocol::ProtocolError& e) {
    return fail(operation, e.kind(), e.status_code(), e.what());
  }
  catch (const crypto::CryptoError& e) {
    return fail(operation, ErrorKind::INIT_REJECTED, std::nullopt, e.what());
  }
  catch (const transport::TransportError& e) {
    return fail(operation, ErrorKind::CONNECTION_UNAVAILABLE, std::nullopt, e.what());
  }
  catch (const std::exception& e) {
    return fail(operation, ErrorKind::CONNECTION_UNAVAILABLE, std::nullopt, e.what());
  }
}

OperationResult Session::fail(const char* operation, ErrorKind kind,
                              std::optional<uint16_t> status_code, const std::string& message) {
  BOOST_LOG_TRIVIAL(error) << "Session: " << operation << " failed with " << kind
                           << (status_code ? " (SW " + protocol::format_status(*status_code) + ")" : "")
                           << ": " << message;

  if (kind == ErrorKind::CONNECTION_UNAVAILABLE) {
    usable_ = false;
    active_.reset();
    read_buffer_.clear();
  }
  else if (kind != ErrorKind::NO_ACTIVE_OPERATION && kind != ErrorKind::OPERATION_IN_PROGRESS) {
    // Sequencing errors leave the active operation untouched, every other failure ends it
    active_.reset();
    read_buffer_.clear();
  }

  return OperationResult::err(kind, status_code, message);
}

OperationResult Session::refuse_if_active(const char* operation) const {
  if (active_) {
    BOOST_LOG_TRIVIAL(warning) << "Session: " << operation << " refused, " << active_->direction()
                               << " operation still in phase " << active_->phase();
    return OperationResult::err(ErrorKind::OPERATION_IN_PROGRESS, std::nullopt,
                                "Another operation is in progress");
  }
  return OperationResult::ok();
}

OperationResult Session::refuse_if_idle(const char* operation) const {
  if (!active_) {
    BOOST_LOG_TRIVIAL(warning) << "Session: " << operation << " refused, no operation was started";
    return OperationResult::err(ErrorKind::NO_ACTIVE_OPERATION, std::nullopt, "No active operation");
  }
  return OperationResult::ok();
}

} // namespace session
} // namespace sevault
