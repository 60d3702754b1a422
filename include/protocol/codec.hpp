#ifndef SEVAULT_PROTOCOL_CODEC_HPP
#define SEVAULT_PROTOCOL_CODEC_HPP

#include <cstdint>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "protocol/apdu_frame.hpp"

namespace sevault {
namespace protocol {

// Pure transform between frames and raw bytes, no I/O
class Codec {
public:
  // ---- ENCODING AND DECODING ----
  // Serializes a command frame:
  //   [CLA INS P1 P2]                     no data, no expected length
  //   [CLA INS P1 P2 Lc data...]          data present
  //   [CLA INS P1 P2 Lc data... Le]       data and expected length
  //   [CLA INS P1 P2 00 Le]               expected length only
  // Throws ProtocolError(INVALID_ARGUMENT) when data does not fit in one frame.
  static std::vector<uint8_t> encode(const CommandFrame& frame);
  // Splits a raw response into data and the trailing status pair.
  // Throws ProtocolError(MALFORMED_RESPONSE) for fewer than two bytes.
  static ResponseFrame decode(const std::vector<uint8_t>& raw);


  // ---- FIELD HELPERS ----
  // Appends a one-byte length prefix followed by the field
  static void append_length_prefixed(std::vector<uint8_t>& out, const std::vector<uint8_t>& field);
  // Reads a big-endian 16-bit value at offset
  static uint16_t read_u16_be(const std::vector<uint8_t>& data, std::size_t offset);

private:
  // Size of CLA INS P1 P2
  static constexpr std::size_t HEADER_SIZE = 4;
  // Size of SW1 SW2
  static constexpr std::size_t STATUS_SIZE = 2;
};

} // namespace protocol
} // namespace sevault

#endif // SEVAULT_PROTOCOL_CODEC_HPP
