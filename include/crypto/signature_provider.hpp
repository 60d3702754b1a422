#ifndef SEVAULT_CRYPTO_SIGNATURE_PROVIDER_HPP
#define SEVAULT_CRYPTO_SIGNATURE_PROVIDER_HPP

#include <cstdint>
#include <vector>

namespace sevault::crypto {

// Capability that signs bytes with key material it holds.
// Signatures over the same bytes must verify against one stable public key.
class SignatureProvider {
public:
  virtual ~SignatureProvider() = default;

  // Throws CryptoError when no signature can be produced
  virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& data) = 0;

protected:
  SignatureProvider() = default;
};

} // namespace sevault::crypto

#endif // SEVAULT_CRYPTO_SIGNATURE_PROVIDER_HPP
