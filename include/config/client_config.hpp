#ifndef SEVAULT_CONFIG_CLIENT_CONFIG_HPP
#define SEVAULT_CONFIG_CLIENT_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "protocol/apdu_frame.hpp"

namespace sevault {
namespace config {

// What the signature provider is asked to sign
enum class DigestPolicy {
  MESSAGE,        // the canonical bytes themselves
  SHA256_DIGEST   // the SHA-256 digest of the canonical bytes
};

// How identity fields are packed for the fixed-length applet
enum class IdentityEncoding {
  ZERO_PAD,  // UTF-8 bytes padded with trailing zeros
  SHA256     // username replaced by its SHA-256 digest
};

// Instruction codes for one chunked direction
struct PhaseInstructions {
  uint8_t init;
  uint8_t cont;
  uint8_t finalize;
};

// Initialized once before any operation, never mutated while a transfer is active
struct ClientConfig {
  // ---- FRAMING ----
  uint8_t cla = protocol::CLA_PROPRIETARY;
  PhaseInstructions store_ins{protocol::INS_STORE_INIT, protocol::INS_STORE_CONTINUE, protocol::INS_STORE_FINALIZE};
  PhaseInstructions read_ins{protocol::INS_READ_INIT, protocol::INS_READ_CONTINUE, protocol::INS_READ_FINALIZE};
  uint8_t fixed_store_ins = protocol::INS_FIXED_STORE;
  uint8_t fixed_read_ins = protocol::INS_FIXED_READ;
  uint8_t fixed_delete_ins = protocol::INS_FIXED_DELETE;


  // ---- CHUNKING ----
  std::size_t store_chunk_size = 200;
  // Le sent with every read CONTINUE, 0 lets the card choose (up to its buffer size)
  uint8_t read_expected_length = 0;


  // ---- AUTHORIZATION ----
  DigestPolicy digest_policy = DigestPolicy::MESSAGE;


  // ---- FIXED-LENGTH RECORDS ----
  IdentityEncoding identity_encoding = IdentityEncoding::ZERO_PAD;
  std::size_t fixed_username_width = 32;
  std::size_t fixed_address_width = 64;
  std::size_t fixed_message_width = 32;
  std::size_t min_signature_length = 8;
  std::size_t max_signature_length = 72;


  // ---- LOGGING ----
  std::string log_file = "sevault.log";
  std::string log_level = "info";


  // Throws std::invalid_argument describing the first inconsistent value
  void validate() const;
};

DigestPolicy parse_digest_policy(const std::string& name);
IdentityEncoding parse_identity_encoding(const std::string& name);
const char* to_string(DigestPolicy policy);
const char* to_string(IdentityEncoding encoding);

} // namespace config
} // namespace sevault

#endif // SEVAULT_CONFIG_CLIENT_CONFIG_HPP
