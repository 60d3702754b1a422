#ifndef SEVAULT_PROTOCOL_APDU_FRAME_HPP
#define SEVAULT_PROTOCOL_APDU_FRAME_HPP

#include <cstdint>
#include <optional>
#include <vector>

namespace sevault {
namespace protocol {

// Default class byte used by the record applet
constexpr uint8_t CLA_PROPRIETARY = 0x80;

// Default instruction codes (variable-length applet)
constexpr uint8_t INS_STORE_INIT = 0x10;
constexpr uint8_t INS_STORE_CONTINUE = 0x11;
constexpr uint8_t INS_STORE_FINALIZE = 0x12;
constexpr uint8_t INS_READ_INIT = 0x20;
constexpr uint8_t INS_READ_CONTINUE = 0x21;
constexpr uint8_t INS_READ_FINALIZE = 0x22;

// Default instruction codes (fixed-length applet)
constexpr uint8_t INS_FIXED_STORE = 0x10;
constexpr uint8_t INS_FIXED_READ = 0x20;
constexpr uint8_t INS_FIXED_DELETE = 0x30;

// Largest data field a short command frame can carry (Lc is one byte)
constexpr std::size_t MAX_COMMAND_DATA = 0xFF;

// A single command sent to the card
struct CommandFrame {
  uint8_t cla = CLA_PROPRIETARY;
  uint8_t ins = 0;
  uint8_t p1 = 0;
  uint8_t p2 = 0;
  std::vector<uint8_t> data;
  std::optional<uint8_t> expected_length;
};

// A single response from the card: data followed by the status pair
struct ResponseFrame {
  std::vector<uint8_t> data;
  uint8_t sw1 = 0;
  uint8_t sw2 = 0;

  uint16_t status_word() const {
    return static_cast<uint16_t>((sw1 << 8) | sw2);
  }
};

} // namespace protocol
} // namespace sevault

#endif // SEVAULT_PROTOCOL_APDU_FRAME_HPP
