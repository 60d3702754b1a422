#include "crypto/digest.hpp"
#include "crypto/crypto_error.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace sevault::crypto {

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw DigestError("Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, data.data(), data.size())) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw DigestError("Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  BOOST_LOG_TRIVIAL(trace) << "Digest: Hashed " << data.size() << " bytes";
  return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string to_hex(const std::vector<uint8_t>& data) {
  std::stringstream ss;
  for (uint8_t byte : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace sevault::crypto
