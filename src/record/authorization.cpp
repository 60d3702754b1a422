#include "record/authorization.hpp"
#include "crypto/digest.hpp"
#include "protocol/codec.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/log/trivial.hpp>

namespace sevault {
namespace record {

std::vector<uint8_t> AuthorizationEnvelope::wire_encoding() const {
  std::vector<uint8_t> out = key.wire_encoding();
  protocol::Codec::append_length_prefixed(out, signature);
  return out;
}

Authorizer::Authorizer(std::shared_ptr<crypto::SignatureProvider> provider, config::DigestPolicy policy)
  : provider_(std::move(provider))
  , policy_(policy) {
  if (!provider_) {
    BOOST_LOG_TRIVIAL(warning) << "Authorizer: No signature provider, reads will carry an empty signature";
  }
}

AuthorizationEnvelope Authorizer::authorize(const RecordKey& key) const {
  AuthorizationEnvelope envelope{key, {}};
  if (!provider_) {
    return envelope;
  }

  envelope.signature = sign_canonical(key.canonical_bytes());
  if (envelope.signature.size() > RecordKey::MAX_FIELD_LENGTH) {
    throw protocol::ProtocolError(protocol::ErrorKind::INVALID_ARGUMENT,
                                  "Signature of " + std::to_string(envelope.signature.size()) +
                                  " bytes does not fit a length prefix");
  }

  BOOST_LOG_TRIVIAL(debug) << "Authorizer: Signed " << key << " (" << envelope.signature.size() << "-byte signature)";
  return envelope;
}

std::vector<uint8_t> Authorizer::sign_canonical(const std::vector<uint8_t>& canonical) const {
  if (!provider_) {
    return {};
  }
  if (policy_ == config::DigestPolicy::SHA256_DIGEST) {
    return provider_->sign(crypto::sha256(canonical));
  }
  return provider_->sign(canonical);
}

} // namespace record
} // namespace sevault
