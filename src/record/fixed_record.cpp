#include "record/fixed_record.hpp"
#include "crypto/digest.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/status.hpp"
#include "transport/exchange.hpp"
#include <boost/log/trivial.hpp>

namespace sevault {
namespace record {

using protocol::ErrorKind;
using protocol::ProtocolError;

FixedRecordClient::FixedRecordClient(transport::Transport& transport, const Authorizer& authorizer,
                                     const config::ClientConfig& config)
  : transport_(transport)
  , authorizer_(authorizer)
  , config_(config) {}


//==============================================
// OPERATIONS
//==============================================

StoreReceipt FixedRecordClient::store(const std::string& username, const std::string& address,
                                      const std::vector<uint8_t>& message) {
  std::vector<uint8_t> data = pack_username(username);
  std::vector<uint8_t> packed_address = pack_address(address);
  std::vector<uint8_t> packed_message = pack_message(message);
  data.insert(data.end(), packed_address.begin(), packed_address.end());
  data.insert(data.end(), packed_message.begin(), packed_message.end());

  protocol::ResponseFrame response = send(config_.fixed_store_ins, std::move(data), "store");
  if (response.data.size() < 2) {
    throw ProtocolError(ErrorKind::MALFORMED_RESPONSE, "Store receipt shorter than 2 bytes");
  }

  StoreReceipt receipt{response.data[0], response.data[1]};
  BOOST_LOG_TRIVIAL(info) << "Fixed records: Stored at index " << static_cast<int>(receipt.record_index)
                          << ", " << static_cast<int>(receipt.record_count) << " records on card";
  return receipt;
}

std::vector<uint8_t> FixedRecordClient::read(const std::string& username, const std::string& address) {
  protocol::ResponseFrame response = send(config_.fixed_read_ins, signed_identity(username, address), "read");

  std::vector<uint8_t> message = strip_trailing_zeros(std::move(response.data));
  BOOST_LOG_TRIVIAL(info) << "Fixed records: Read " << message.size() << " bytes";
  return message;
}

DeleteReceipt FixedRecordClient::remove(const std::string& username, const std::string& address) {
  protocol::ResponseFrame response = send(config_.fixed_delete_ins, signed_identity(username, address), "delete");
  if (response.data.size() < 2) {
    throw ProtocolError(ErrorKind::MALFORMED_RESPONSE, "Delete receipt shorter than 2 bytes");
  }

  DeleteReceipt receipt{response.data[0], response.data[1]};
  BOOST_LOG_TRIVIAL(info) << "Fixed records: Deleted index " << static_cast<int>(receipt.deleted_index)
                          << ", " << static_cast<int>(receipt.remaining_count) << " records remain";
  return receipt;
}


//==============================================
// FIELD PACKING
//==============================================

std::vector<uint8_t> FixedRecordClient::pack_username(const std::string& username) const {
  std::vector<uint8_t> raw(username.begin(), username.end());
  if (config_.identity_encoding == config::IdentityEncoding::SHA256) {
    raw = crypto::sha256(raw);
  }
  return pad_to_width(raw, config_.fixed_username_width, "username");
}

std::vector<uint8_t> FixedRecordClient::pack_address(const std::string& address) const {
  return pad_to_width(std::vector<uint8_t>(address.begin(), address.end()),
                      config_.fixed_address_width, "address");
}

std::vector<uint8_t> FixedRecordClient::pack_message(const std::vector<uint8_t>& message) const {
  return pad_to_width(message, config_.fixed_message_width, "message");
}

std::vector<uint8_t> FixedRecordClient::pad_to_width(const std::vector<uint8_t>& field, std::size_t width,
                                                     const char* field_name) {
  if (field.size() > width) {
    throw ProtocolError(ErrorKind::INVALID_ARGUMENT,
                        std::string(field_name) + " is " + std::to_string(field.size()) +
                        " bytes, limit is " + std::to_string(width));
  }
  std::vector<uint8_t> padded(field);
  padded.resize(width, 0x00);
  return padded;
}

std::vector<uint8_t> FixedRecordClient::strip_trailing_zeros(std::vector<uint8_t> data) {
  while (!data.empty() && data.back() == 0x00) {
    data.pop_back();
  }
  return data;
}


//==============================================
// HELPERS
//==============================================

std::vector<uint8_t> FixedRecordClient::signed_identity(const std::string& username,
                                                        const std::string& address) const {
  std::vector<uint8_t> data = pack_username(username);
  std::vector<uint8_t> packed_address = pack_address(address);
  data.insert(data.end(), packed_address.begin(), packed_address.end());

  std::vector<uint8_t> signature = authorizer_.sign_canonical(data);
  if (signature.size() < config_.min_signature_length || signature.size() > config_.max_signature_length) {
    throw ProtocolError(ErrorKind::INVALID_ARGUMENT,
                        "Signature length " + std::to_string(signature.size()) + " outside [" +
                        std::to_string(config_.min_signature_length) + ", " +
                        std::to_string(config_.max_signature_length) + "]");
  }

  data.insert(data.end(), signature.begin(), signature.end());
  return data;
}

protocol::ResponseFrame FixedRecordClient::send(uint8_t ins, std::vector<uint8_t> data, const char* operation) {
  protocol::CommandFrame command;
  command.cla = config_.cla;
  command.ins = ins;
  command.data = std::move(data);

  protocol::ResponseFrame response = transport::exchange(transport_, command);
  uint16_t sw = response.status_word();
  if (!protocol::StatusOutcome::classify(sw).is_success()) {
    BOOST_LOG_TRIVIAL(warning) << "Fixed records: " << operation << " rejected with "
                               << protocol::format_status(sw) << " (" << protocol::describe_status(sw) << ")";
    throw ProtocolError(ErrorKind::INIT_REJECTED,
                        std::string(operation) + " rejected: " + protocol::describe_status(sw), sw);
  }
  return response;
}

} // namespace record
} // namespace sevault
