#include "transport/exchange.hpp"
#include "protocol/codec.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/status.hpp"
#include <boost/log/trivial.hpp>

namespace sevault {
namespace transport {

protocol::ResponseFrame exchange(Transport& transport, const protocol::CommandFrame& command) {
  std::vector<uint8_t> encoded = protocol::Codec::encode(command);

  BOOST_LOG_TRIVIAL(debug) << "Exchange: Sending INS=0x" << std::hex << static_cast<int>(command.ins)
                           << " P1=0x" << static_cast<int>(command.p1)
                           << " P2=0x" << static_cast<int>(command.p2) << std::dec
                           << " Lc=" << command.data.size()
                           << (command.expected_length ? " Le=" + std::to_string(*command.expected_length) : "");

  std::vector<uint8_t> raw;
  try {
    raw = transport.transmit(encoded);
  }
  catch (const TransportError& e) {
    BOOST_LOG_TRIVIAL(error) << "Exchange: Transport failure: " << e.what();
    throw protocol::ProtocolError(protocol::ErrorKind::CONNECTION_UNAVAILABLE, e.what());
  }

  protocol::ResponseFrame response = protocol::Codec::decode(raw);
  BOOST_LOG_TRIVIAL(debug) << "Exchange: Received " << response.data.size() << " data bytes, SW="
                           << protocol::format_status(response.status_word());
  return response;
}

} // namespace transport
} // namespace sevault
