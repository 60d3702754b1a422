#ifndef SEVAULT_PROTOCOL_ERROR_HPP
#define SEVAULT_PROTOCOL_ERROR_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace sevault {
namespace protocol {

enum class ErrorKind {
  CONNECTION_UNAVAILABLE,
  INIT_REJECTED,
  CHUNK_REJECTED,
  FINALIZE_FAILED,
  MALFORMED_RESPONSE,
  NO_ACTIVE_OPERATION,
  OPERATION_IN_PROGRESS,
  INVALID_ARGUMENT
};

const char* to_string(ErrorKind kind);

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

// Raised by the codec, the transfer engine and the record clients.
// Carries the status word when the failure came from the card.
class ProtocolError : public std::runtime_error {
public:
  ProtocolError(ErrorKind kind, const std::string& message,
                std::optional<uint16_t> status_code = std::nullopt)
    : std::runtime_error(message)
    , kind_(kind)
    , status_code_(status_code) {}

  ErrorKind kind() const { return kind_; }
  std::optional<uint16_t> status_code() const { return status_code_; }

private:
  ErrorKind kind_;
  std::optional<uint16_t> status_code_;
};

} // namespace protocol
} // namespace sevault

#endif // SEVAULT_PROTOCOL_ERROR_HPP
