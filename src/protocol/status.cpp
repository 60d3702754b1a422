#include "protocol/status.hpp"
#include <iomanip>
#include <sstream>

namespace sevault {
namespace protocol {

StatusOutcome StatusOutcome::classify(uint8_t sw1, uint8_t sw2) {
  uint16_t code = static_cast<uint16_t>((sw1 << 8) | sw2);

  if (code == SW_SUCCESS) {
    return StatusOutcome(StatusKind::SUCCESS, code);
  }
  if (sw1 == SW1_MORE_DATA) {
    return StatusOutcome(StatusKind::MORE_DATA, code);
  }
  return StatusOutcome(StatusKind::FAILURE, code);
}

StatusOutcome StatusOutcome::classify(uint16_t status_word) {
  return classify(static_cast<uint8_t>(status_word >> 8), static_cast<uint8_t>(status_word & 0xFF));
}

std::string format_status(uint16_t status_word) {
  std::stringstream ss;
  ss << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << status_word;
  return ss.str();
}

std::string describe_status(uint16_t status_word) {
  if ((status_word >> 8) == SW1_MORE_DATA) {
    return "More data available";
  }

  switch (status_word) {
    case SW_SUCCESS:                  return "Success";
    case SW_VERIFICATION_FAILED:      return "Verification failed";
    case SW_WRONG_LENGTH:             return "Wrong length";
    case SW_SIGNATURE_INVALID:        return "Signature invalid";
    case SW_CONDITIONS_NOT_SATISFIED: return "Conditions of use not satisfied";
    case SW_RECORD_NOT_FOUND:         return "Record not found";
    case SW_FILE_FULL:                return "Storage full";
    case SW_INCORRECT_P1P2:           return "Incorrect P1/P2";
    case SW_INS_NOT_SUPPORTED:        return "Instruction not supported";
    default:                          return "Unrecognized status";
  }
}

std::ostream& operator<<(std::ostream& os, StatusKind kind) {
  switch (kind) {
    case StatusKind::SUCCESS:   os << "SUCCESS"; break;
    case StatusKind::MORE_DATA: os << "MORE_DATA"; break;
    case StatusKind::FAILURE:   os << "FAILURE"; break;
  }
  return os;
}

} // namespace protocol
} // namespace sevault
