#ifndef SEVAULT_CRYPTO_ERROR_HPP
#define SEVAULT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace sevault::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class KeyLoadError : public CryptoError {
public:
    explicit KeyLoadError(const std::string& message)
        : CryptoError("Key load error: " + message) {}
};

class SigningError : public CryptoError {
public:
    explicit SigningError(const std::string& message)
        : CryptoError("Signing error: " + message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Digest error: " + message) {}
};

} // namespace sevault::crypto

#endif // SEVAULT_CRYPTO_ERROR_HPP
