#include "crypto/ec_key_signer.hpp"
#include <fstream>
#include <sstream>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <boost/log/trivial.hpp>

namespace sevault::crypto {

//=================================================
// RAII WRAPPERS FOR OPENSSL OBJECTS
//=================================================

struct KeyHandle {
  EVP_PKEY* pkey = nullptr;

  explicit KeyHandle(EVP_PKEY* key) : pkey(key) {}

  ~KeyHandle() {
    if (pkey) {
      EVP_PKEY_free(pkey);
    }
  }

  KeyHandle(const KeyHandle&) = delete;
  KeyHandle& operator=(const KeyHandle&) = delete;

  EVP_PKEY* get() { return pkey; }
};

namespace {

struct SignContext {
  EVP_MD_CTX* ctx = nullptr;

  SignContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw SigningError("Failed to create digest context");
    }
  }

  ~SignContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

struct BioHandle {
  BIO* bio = nullptr;

  explicit BioHandle(BIO* b) : bio(b) {}

  ~BioHandle() {
    if (bio) {
      BIO_free(bio);
    }
  }

  BIO* get() { return bio; }
};

// Pops the most recent OpenSSL error into a readable string
std::string last_openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "no OpenSSL error reported";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}

} // namespace


//==============================================
// CONSTRUCTION
//==============================================

EcKeySigner::EcKeySigner(std::unique_ptr<KeyHandle> key)
  : key_(std::move(key)) {
  BOOST_LOG_TRIVIAL(info) << "EC signer: Key loaded (" << EVP_PKEY_get_bits(key_->get()) << "-bit curve)";
}

EcKeySigner::~EcKeySigner() = default;

std::unique_ptr<EcKeySigner> EcKeySigner::from_pem_file(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "EC signer: Loading private key from " << path;

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "EC signer: Cannot open key file: " << path;
    throw KeyLoadError("Cannot open key file: " + path);
  }

  std::stringstream contents;
  contents << file.rdbuf();
  return from_pem(contents.str());
}

std::unique_ptr<EcKeySigner> EcKeySigner::from_pem(const std::string& pem) {
  BioHandle bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio.get()) {
    throw KeyLoadError("Failed to allocate memory BIO");
  }

  EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!pkey) {
    std::string reason = last_openssl_error();
    BOOST_LOG_TRIVIAL(error) << "EC signer: PEM parsing failed: " << reason;
    throw KeyLoadError("Invalid PEM private key: " + reason);
  }

  auto key = std::make_unique<KeyHandle>(pkey);
  if (EVP_PKEY_base_id(key->get()) != EVP_PKEY_EC) {
    BOOST_LOG_TRIVIAL(error) << "EC signer: Key is not an EC key";
    throw KeyLoadError("Private key is not an EC key");
  }

  return std::unique_ptr<EcKeySigner>(new EcKeySigner(std::move(key)));
}


//==============================================
// SIGNING
//==============================================

std::vector<uint8_t> EcKeySigner::sign(const std::vector<uint8_t>& data) {
  SignContext context;

  if (EVP_DigestSignInit(context.get(), nullptr, EVP_sha256(), nullptr, key_->get()) != 1) {
    throw SigningError("Failed to initialize signing: " + last_openssl_error());
  }

  // First pass reports the maximum DER size
  size_t signature_len = 0;
  if (EVP_DigestSign(context.get(), nullptr, &signature_len, data.data(), data.size()) != 1) {
    throw SigningError("Failed to size signature: " + last_openssl_error());
  }

  std::vector<uint8_t> signature(signature_len);
  if (EVP_DigestSign(context.get(), signature.data(), &signature_len, data.data(), data.size()) != 1) {
    throw SigningError("Failed to sign data: " + last_openssl_error());
  }
  signature.resize(signature_len);

  BOOST_LOG_TRIVIAL(debug) << "EC signer: Signed " << data.size() << " bytes, signature length " << signature_len;
  return signature;
}


//==============================================
// KEY EXPORT
//==============================================

std::string EcKeySigner::public_key_pem() const {
  BioHandle bio(BIO_new(BIO_s_mem()));
  if (!bio.get()) {
    throw CryptoError("Failed to allocate memory BIO");
  }

  if (PEM_write_bio_PUBKEY(bio.get(), key_->get()) != 1) {
    throw CryptoError("Failed to export public key: " + last_openssl_error());
  }

  char* data = nullptr;
  long length = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<std::size_t>(length));
}

} // namespace sevault::crypto
