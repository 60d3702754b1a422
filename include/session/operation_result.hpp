#ifndef SEVAULT_SESSION_OPERATION_RESULT_HPP
#define SEVAULT_SESSION_OPERATION_RESULT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/protocol_error.hpp"

namespace sevault {
namespace session {

// Ok(payload?) or Err(kind, status code?), returned by every session call
class OperationResult {
public:
  static OperationResult ok() {
    return OperationResult(std::nullopt, std::nullopt, std::nullopt, "");
  }

  static OperationResult ok(std::vector<uint8_t> payload) {
    return OperationResult(std::move(payload), std::nullopt, std::nullopt, "");
  }

  static OperationResult err(protocol::ErrorKind kind, std::optional<uint16_t> status_code,
                             const std::string& message) {
    return OperationResult(std::nullopt, kind, status_code, message);
  }

  bool is_ok() const { return !error_kind_.has_value(); }
  explicit operator bool() const { return is_ok(); }

  const std::optional<std::vector<uint8_t>>& payload() const { return payload_; }
  std::optional<protocol::ErrorKind> error_kind() const { return error_kind_; }
  std::optional<uint16_t> status_code() const { return status_code_; }
  const std::string& message() const { return message_; }

private:
  OperationResult(std::optional<std::vector<uint8_t>> payload,
                  std::optional<protocol::ErrorKind> error_kind,
                  std::optional<uint16_t> status_code,
                  std::string message)
    : payload_(std::move(payload))
    , error_kind_(error_kind)
    , status_code_(status_code)
    , message_(std::move(message)) {}

  std::optional<std::vector<uint8_t>> payload_;
  std::optional<protocol::ErrorKind> error_kind_;
  std::optional<uint16_t> status_code_;
  std::string message_;
};

} // namespace session
} // namespace sevault

#endif // SEVAULT_SESSION_OPERATION_RESULT_HPP
