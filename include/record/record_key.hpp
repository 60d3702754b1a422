#ifndef SEVAULT_RECORD_RECORD_KEY_HPP
#define SEVAULT_RECORD_RECORD_KEY_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace sevault {
namespace record {

/**
 * Identity of a stored record: an opaque (username, address) pair.
 * Both fields are raw bytes, each at most 255 long so they fit
 * a one-byte length prefix. Empty fields are allowed.
 */
class RecordKey {
public:
  // Throws ProtocolError(INVALID_ARGUMENT) if a field exceeds MAX_FIELD_LENGTH
  RecordKey(std::vector<uint8_t> username, std::vector<uint8_t> address);

  // UTF-8 convenience for CLI and tests
  static RecordKey from_strings(const std::string& username, const std::string& address);

  const std::vector<uint8_t>& username() const { return username_; }
  const std::vector<uint8_t>& address() const { return address_; }

  // username || address, the bytes covered by a read signature
  std::vector<uint8_t> canonical_bytes() const;

  // [len][username][len][address]
  std::vector<uint8_t> wire_encoding() const;

  bool operator==(const RecordKey& other) const;
  bool operator!=(const RecordKey& other) const { return !(*this == other); }

  static constexpr std::size_t MAX_FIELD_LENGTH = 0xFF;

private:
  std::vector<uint8_t> username_;
  std::vector<uint8_t> address_;
};

// Prints field lengths only, contents stay out of logs
std::ostream& operator<<(std::ostream& os, const RecordKey& key);

} // namespace record
} // namespace sevault

#endif // SEVAULT_RECORD_RECORD_KEY_HPP
