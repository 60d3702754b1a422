#ifndef SEVAULT_PROTOCOL_STATUS_HPP
#define SEVAULT_PROTOCOL_STATUS_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace sevault {
namespace protocol {

// Status words returned by the record applets
constexpr uint16_t SW_SUCCESS = 0x9000;
constexpr uint8_t SW1_MORE_DATA = 0x61;
constexpr uint16_t SW_VERIFICATION_FAILED = 0x6300;
constexpr uint16_t SW_WRONG_LENGTH = 0x6700;
constexpr uint16_t SW_SIGNATURE_INVALID = 0x6982;
constexpr uint16_t SW_CONDITIONS_NOT_SATISFIED = 0x6985;
constexpr uint16_t SW_RECORD_NOT_FOUND = 0x6A83;
constexpr uint16_t SW_FILE_FULL = 0x6A84;
constexpr uint16_t SW_INCORRECT_P1P2 = 0x6A86;
constexpr uint16_t SW_INS_NOT_SUPPORTED = 0x6D00;
constexpr uint16_t SW_UNKNOWN = 0x6F00;

enum class StatusKind {
  SUCCESS,
  MORE_DATA,
  FAILURE
};

/**
 * Tagged outcome of one exchange.
 * 0x9000 is SUCCESS, 0x61xx is MORE_DATA with xx as a coarse remaining-byte
 * hint (saturates at 0xFF, not authoritative), anything else is FAILURE.
 */
class StatusOutcome {
public:
  static StatusOutcome classify(uint8_t sw1, uint8_t sw2);
  static StatusOutcome classify(uint16_t status_word);

  StatusKind kind() const { return kind_; }
  uint16_t code() const { return code_; }

  bool is_success() const { return kind_ == StatusKind::SUCCESS; }
  bool is_more_data() const { return kind_ == StatusKind::MORE_DATA; }
  bool is_failure() const { return kind_ == StatusKind::FAILURE; }

  // Low byte of a MORE_DATA status, zero otherwise
  uint8_t remaining_hint() const {
    return kind_ == StatusKind::MORE_DATA ? static_cast<uint8_t>(code_ & 0xFF) : 0;
  }

private:
  StatusOutcome(StatusKind kind, uint16_t code) : kind_(kind), code_(code) {}

  StatusKind kind_;
  uint16_t code_;
};

// Human readable name for a status word, used in logs and CLI output
std::string describe_status(uint16_t status_word);

// Formats a status word as four upper-case hex digits
std::string format_status(uint16_t status_word);

std::ostream& operator<<(std::ostream& os, StatusKind kind);

} // namespace protocol
} // namespace sevault

#endif // SEVAULT_PROTOCOL_STATUS_HPP
