#ifndef SEVAULT_CRYPTO_EC_KEY_SIGNER_HPP
#define SEVAULT_CRYPTO_EC_KEY_SIGNER_HPP

#include <memory>
#include <string>
#include <vector>
#include "crypto/signature_provider.hpp"
#include "crypto/crypto_error.hpp"

namespace sevault::crypto {

// Forward declaration for the OpenSSL key wrapper
struct KeyHandle;

// ECDSA-SHA256 signer backed by an EC private key held in memory.
// Produces DER encoded signatures.
class EcKeySigner : public SignatureProvider {
public:
  EcKeySigner(const EcKeySigner&) = delete;
  EcKeySigner& operator=(const EcKeySigner&) = delete;


  // ---- CONSTRUCTION ----
  // Loads a PEM private key from disk, throws KeyLoadError
  static std::unique_ptr<EcKeySigner> from_pem_file(const std::string& path);
  // Loads a PEM private key from a string, throws KeyLoadError
  static std::unique_ptr<EcKeySigner> from_pem(const std::string& pem);

  ~EcKeySigner() override;


  // ---- SIGNING ----
  std::vector<uint8_t> sign(const std::vector<uint8_t>& data) override;


  // ---- KEY EXPORT ----
  // Public half in SubjectPublicKeyInfo PEM, for device personalization
  std::string public_key_pem() const;

private:
  explicit EcKeySigner(std::unique_ptr<KeyHandle> key);

  std::unique_ptr<KeyHandle> key_;
};

} // namespace sevault::crypto

#endif // SEVAULT_CRYPTO_EC_KEY_SIGNER_HPP
