#ifndef SEVAULT_RECORD_FIXED_RECORD_HPP
#define SEVAULT_RECORD_FIXED_RECORD_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "config/client_config.hpp"
#include "record/authorization.hpp"
#include "transport/transport.hpp"

namespace sevault {
namespace record {

struct StoreReceipt {
  uint8_t record_index = 0;
  uint8_t record_count = 0;
};

struct DeleteReceipt {
  uint8_t deleted_index = 0;
  uint8_t remaining_count = 0;
};

/**
 * Client for the fixed-length applet. Every operation is one exchange:
 *   store   [user(W_u) || addr(W_a) || message(W_m)]
 *   read    [user(W_u) || addr(W_a) || DER signature]
 *   delete  [user(W_u) || addr(W_a) || DER signature]
 * Non-success status words throw ProtocolError(INIT_REJECTED) with the code.
 */
class FixedRecordClient {
public:
  FixedRecordClient(transport::Transport& transport, const Authorizer& authorizer,
                    const config::ClientConfig& config);

  // ---- OPERATIONS ----
  StoreReceipt store(const std::string& username, const std::string& address,
                     const std::vector<uint8_t>& message);
  // Returns the stored message with trailing zero bytes removed
  std::vector<uint8_t> read(const std::string& username, const std::string& address);
  DeleteReceipt remove(const std::string& username, const std::string& address);


  // ---- FIELD PACKING ----
  std::vector<uint8_t> pack_username(const std::string& username) const;
  std::vector<uint8_t> pack_address(const std::string& address) const;
  std::vector<uint8_t> pack_message(const std::vector<uint8_t>& message) const;

  // Pads with zeros up to width, throws ProtocolError(INVALID_ARGUMENT) on overflow
  static std::vector<uint8_t> pad_to_width(const std::vector<uint8_t>& field, std::size_t width,
                                           const char* field_name);
  static std::vector<uint8_t> strip_trailing_zeros(std::vector<uint8_t> data);

private:
  // Builds [user || addr || signature] and checks the signature bounds
  std::vector<uint8_t> signed_identity(const std::string& username, const std::string& address) const;
  protocol::ResponseFrame send(uint8_t ins, std::vector<uint8_t> data, const char* operation);

  transport::Transport& transport_;
  const Authorizer& authorizer_;
  const config::ClientConfig& config_;
};

} // namespace record
} // namespace sevault

#endif // SEVAULT_RECORD_FIXED_RECORD_HPP
