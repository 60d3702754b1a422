#ifndef SEVAULT_TRANSPORT_EXCHANGE_HPP
#define SEVAULT_TRANSPORT_EXCHANGE_HPP

#include "protocol/apdu_frame.hpp"
#include "transport/transport.hpp"

namespace sevault {
namespace transport {

// Encodes the command, transmits it and decodes the response.
// Transport failures surface as ProtocolError(CONNECTION_UNAVAILABLE).
protocol::ResponseFrame exchange(Transport& transport, const protocol::CommandFrame& command);

} // namespace transport
} // namespace sevault

#endif // SEVAULT_TRANSPORT_EXCHANGE_HPP
