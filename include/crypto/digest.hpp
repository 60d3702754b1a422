#ifndef SEVAULT_CRYPTO_DIGEST_HPP
#define SEVAULT_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace sevault::crypto {

constexpr std::size_t SHA256_SIZE = 32;

// SHA-256 through OpenSSL EVP, throws DigestError
std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

// Lower-case hex encoding
std::string to_hex(const std::vector<uint8_t>& data);

} // namespace sevault::crypto

#endif // SEVAULT_CRYPTO_DIGEST_HPP
