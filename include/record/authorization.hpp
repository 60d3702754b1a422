#ifndef SEVAULT_RECORD_AUTHORIZATION_HPP
#define SEVAULT_RECORD_AUTHORIZATION_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "config/client_config.hpp"
#include "crypto/signature_provider.hpp"
#include "record/record_key.hpp"

namespace sevault {
namespace record {

// Key plus the signature proving the caller may read it
struct AuthorizationEnvelope {
  RecordKey key;
  std::vector<uint8_t> signature;

  bool has_signature() const { return !signature.empty(); }

  // [len][username][len][address][len][signature]
  std::vector<uint8_t> wire_encoding() const;
};

// Builds authorization envelopes for read requests
class Authorizer {
public:
  // A null provider yields envelopes with an empty signature
  Authorizer(std::shared_ptr<crypto::SignatureProvider> provider, config::DigestPolicy policy);

  // Signs the key's canonical bytes. Throws CryptoError on provider failure,
  // ProtocolError(INVALID_ARGUMENT) if the signature exceeds 255 bytes.
  AuthorizationEnvelope authorize(const RecordKey& key) const;

  // Signs arbitrary canonical bytes under the configured digest policy
  std::vector<uint8_t> sign_canonical(const std::vector<uint8_t>& canonical) const;

  bool has_provider() const { return provider_ != nullptr; }
  config::DigestPolicy policy() const { return policy_; }

private:
  std::shared_ptr<crypto::SignatureProvider> provider_;
  config::DigestPolicy policy_;
};

} // namespace record
} // namespace sevault

#endif // SEVAULT_RECORD_AUTHORIZATION_HPP
