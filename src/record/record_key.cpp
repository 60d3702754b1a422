#include "record/record_key.hpp"
#include "protocol/codec.hpp"
#include "protocol/protocol_error.hpp"

namespace sevault {
namespace record {

RecordKey::RecordKey(std::vector<uint8_t> username, std::vector<uint8_t> address)
  : username_(std::move(username))
  , address_(std::move(address)) {
  if (username_.size() > MAX_FIELD_LENGTH) {
    throw protocol::ProtocolError(protocol::ErrorKind::INVALID_ARGUMENT,
                                  "Username exceeds " + std::to_string(MAX_FIELD_LENGTH) + " bytes");
  }
  if (address_.size() > MAX_FIELD_LENGTH) {
    throw protocol::ProtocolError(protocol::ErrorKind::INVALID_ARGUMENT,
                                  "Address exceeds " + std::to_string(MAX_FIELD_LENGTH) + " bytes");
  }
}

RecordKey RecordKey::from_strings(const std::string& username, const std::string& address) {
  return RecordKey(std::vector<uint8_t>(username.begin(), username.end()),
                   std::vector<uint8_t>(address.begin(), address.end()));
}

std::vector<uint8_t> RecordKey::canonical_bytes() const {
  std::vector<uint8_t> bytes;
  bytes.reserve(username_.size() + address_.size());
  bytes.insert(bytes.end(), username_.begin(), username_.end());
  bytes.insert(bytes.end(), address_.begin(), address_.end());
  return bytes;
}

std::vector<uint8_t> RecordKey::wire_encoding() const {
  std::vector<uint8_t> out;
  out.reserve(2 + username_.size() + address_.size());
  protocol::Codec::append_length_prefixed(out, username_);
  protocol::Codec::append_length_prefixed(out, address_);
  return out;
}

bool RecordKey::operator==(const RecordKey& other) const {
  return username_ == other.username_ && address_ == other.address_;
}

std::ostream& operator<<(std::ostream& os, const RecordKey& key) {
  os << "RecordKey(user " << key.username().size() << "B, addr " << key.address().size() << "B)";
  return os;
}

} // namespace record
} // namespace sevault
