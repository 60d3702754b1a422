#ifndef SEVAULT_TRANSPORT_TRANSPORT_HPP
#define SEVAULT_TRANSPORT_TRANSPORT_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sevault {
namespace transport {

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

// Synchronous command/response channel to the card.
// One exchange at a time; implementations shared between callers must
// serialize transmit() themselves.
class Transport {
public:
    virtual ~Transport() = default;

    // Sends one encoded command and blocks until the raw response
    // (data followed by SW1 SW2) is received. Throws TransportError.
    virtual std::vector<uint8_t> transmit(const std::vector<uint8_t>& command) = 0;

protected:
    Transport() = default;
};

} // namespace transport
} // namespace sevault

#endif // SEVAULT_TRANSPORT_TRANSPORT_HPP
