#include "protocol/codec.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/log/trivial.hpp>
#include <string>

namespace sevault {
namespace protocol {

//==============================================
// ENCODING AND DECODING
//==============================================

std::vector<uint8_t> Codec::encode(const CommandFrame& frame) {
  if (frame.data.size() > MAX_COMMAND_DATA) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Command data of " << frame.data.size()
                             << " bytes exceeds single frame limit of " << MAX_COMMAND_DATA;
    throw ProtocolError(ErrorKind::INVALID_ARGUMENT,
                        "Codec: Command data too long for one frame: " + std::to_string(frame.data.size()));
  }

  std::vector<uint8_t> encoded;
  encoded.reserve(HEADER_SIZE + 1 + frame.data.size() + 1);

  encoded.push_back(frame.cla);
  encoded.push_back(frame.ins);
  encoded.push_back(frame.p1);
  encoded.push_back(frame.p2);

  if (!frame.data.empty()) {
    encoded.push_back(static_cast<uint8_t>(frame.data.size()));
    encoded.insert(encoded.end(), frame.data.begin(), frame.data.end());
  } else if (frame.expected_length) {
    // Zero-length data field so the next byte is read as Le
    encoded.push_back(0x00);
  }

  if (frame.expected_length) {
    encoded.push_back(*frame.expected_length);
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Encoded command INS=0x" << std::hex << static_cast<int>(frame.ins)
                           << std::dec << " into " << encoded.size() << " bytes";
  return encoded;
}

ResponseFrame Codec::decode(const std::vector<uint8_t>& raw) {
  if (raw.size() < STATUS_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Response of " << raw.size() << " bytes has no status word";
    throw ProtocolError(ErrorKind::MALFORMED_RESPONSE, "Codec: Response shorter than status word");
  }

  ResponseFrame response;
  response.data.assign(raw.begin(), raw.end() - STATUS_SIZE);
  response.sw1 = raw[raw.size() - 2];
  response.sw2 = raw[raw.size() - 1];
  return response;
}


//==============================================
// FIELD HELPERS
//==============================================

void Codec::append_length_prefixed(std::vector<uint8_t>& out, const std::vector<uint8_t>& field) {
  if (field.size() > 0xFF) {
    throw ProtocolError(ErrorKind::INVALID_ARGUMENT,
                        "Codec: Field too long for one-byte length prefix: " + std::to_string(field.size()));
  }
  out.push_back(static_cast<uint8_t>(field.size()));
  out.insert(out.end(), field.begin(), field.end());
}

uint16_t Codec::read_u16_be(const std::vector<uint8_t>& data, std::size_t offset) {
  if (offset + sizeof(uint16_t) > data.size()) {
    throw ProtocolError(ErrorKind::MALFORMED_RESPONSE, "Codec: Not enough bytes for 16-bit field");
  }
  return boost::endian::load_big_u16(data.data() + offset);
}

} // namespace protocol
} // namespace sevault
