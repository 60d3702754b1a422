#include "config/client_config.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace sevault {
namespace config {

void ClientConfig::validate() const {
  if (store_chunk_size == 0 || store_chunk_size > protocol::MAX_COMMAND_DATA) {
    throw std::invalid_argument("Config: store chunk size must be 1.." +
                                std::to_string(protocol::MAX_COMMAND_DATA) +
                                ", got " + std::to_string(store_chunk_size));
  }

  if (fixed_username_width == 0 || fixed_address_width == 0 || fixed_message_width == 0) {
    throw std::invalid_argument("Config: fixed record widths must be non-zero");
  }

  if (fixed_username_width + fixed_address_width + fixed_message_width > protocol::MAX_COMMAND_DATA) {
    throw std::invalid_argument("Config: fixed record does not fit in one frame");
  }

  if (min_signature_length > max_signature_length) {
    throw std::invalid_argument("Config: minimum signature length exceeds maximum");
  }

  if (fixed_username_width + fixed_address_width + max_signature_length > protocol::MAX_COMMAND_DATA) {
    throw std::invalid_argument("Config: fixed read request with maximum signature does not fit in one frame");
  }

  if (identity_encoding == IdentityEncoding::SHA256 && fixed_username_width < 32) {
    throw std::invalid_argument("Config: SHA256 identity encoding needs a username width of at least 32");
  }

  BOOST_LOG_TRIVIAL(debug) << "Config: Validated (chunk size " << store_chunk_size
                           << ", digest policy " << to_string(digest_policy)
                           << ", identity encoding " << to_string(identity_encoding) << ")";
}

DigestPolicy parse_digest_policy(const std::string& name) {
  if (name == "message") {
    return DigestPolicy::MESSAGE;
  }
  if (name == "sha256") {
    return DigestPolicy::SHA256_DIGEST;
  }
  throw std::invalid_argument("Config: unknown digest policy: " + name);
}

IdentityEncoding parse_identity_encoding(const std::string& name) {
  if (name == "pad") {
    return IdentityEncoding::ZERO_PAD;
  }
  if (name == "sha256") {
    return IdentityEncoding::SHA256;
  }
  throw std::invalid_argument("Config: unknown identity encoding: " + name);
}

const char* to_string(DigestPolicy policy) {
  switch (policy) {
    case DigestPolicy::MESSAGE:       return "message";
    case DigestPolicy::SHA256_DIGEST: return "sha256";
    default:                          return "unknown";
  }
}

const char* to_string(IdentityEncoding encoding) {
  switch (encoding) {
    case IdentityEncoding::ZERO_PAD: return "pad";
    case IdentityEncoding::SHA256:   return "sha256";
    default:                         return "unknown";
  }
}

} // namespace config
} // namespace sevault
