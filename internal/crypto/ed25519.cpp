#include "ed25519.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <cstdio>
#include <stdexcept>

namespace provgate::crypto {

namespace {

constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSignatureSize = 64;

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

struct BioDeleter {
  void operator()(BIO* bio) const {
    BIO_free(bio);
  }
};

std::string LastOpensslError() {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

} // namespace

Ed25519Key::Ed25519Key(EVP_PKEY* key, bool has_private) : key_(key, PkeyDeleter{}), has_private_(has_private) {
}

Ed25519Key Ed25519Key::Generate() {
  EVP_PKEY*     key = nullptr;
  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
  if (!ctx) {
    throw std::runtime_error("EVP_PKEY_CTX_new_id failed: " + LastOpensslError());
  }
  const bool ok = EVP_PKEY_keygen_init(ctx) == 1 && EVP_PKEY_keygen(ctx, &key) == 1;
  EVP_PKEY_CTX_free(ctx);
  if (!ok) {
    throw std::runtime_error("ed25519 keygen failed: " + LastOpensslError());
  }
  return Ed25519Key(key, true);
}

Ed25519Key Ed25519Key::FromPrivatePemFile(const std::string& path) {
  FILE* fp = std::fopen(path.c_str(), "r");
  if (!fp) {
    throw std::runtime_error("cannot open private key: " + path);
  }
  EVP_PKEY* key = PEM_read_PrivateKey(fp, nullptr, nullptr, nullptr);
  std::fclose(fp);

  if (!key) {
    throw std::runtime_error("invalid private key " + path + ": " + LastOpensslError());
  }
  if (EVP_PKEY_id(key) != EVP_PKEY_ED25519) {
    EVP_PKEY_free(key);
    throw std::runtime_error("private key is not Ed25519: " + path);
  }
  return Ed25519Key(key, true);
}

Ed25519Key Ed25519Key::FromPrivatePem(std::string_view pem) {
  std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    throw std::runtime_error("BIO_new_mem_buf failed");
  }
  EVP_PKEY* key = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (!key) {
    throw std::runtime_error("invalid private key PEM: " + LastOpensslError());
  }
  if (EVP_PKEY_id(key) != EVP_PKEY_ED25519) {
    EVP_PKEY_free(key);
    throw std::runtime_error("private key is not Ed25519");
  }
  return Ed25519Key(key, true);
}

Ed25519Key Ed25519Key::FromRawPublic(std::string_view raw) {
  if (raw.size() != kPublicKeySize) {
    throw std::invalid_argument("ed25519 public key must be 32 bytes");
  }
  EVP_PKEY* key = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
  if (!key) {
    throw std::runtime_error("invalid ed25519 public key: " + LastOpensslError());
  }
  return Ed25519Key(key, false);
}

std::string Ed25519Key::PublicRaw() const {
  std::string out(kPublicKeySize, '\0');
  std::size_t len = out.size();
  if (EVP_PKEY_get_raw_public_key(key_.get(), reinterpret_cast<unsigned char*>(out.data()), &len) != 1) {
    throw std::runtime_error("EVP_PKEY_get_raw_public_key failed: " + LastOpensslError());
  }
  out.resize(len);
  return out;
}

std::string Ed25519Key::Sign(std::string_view message) const {
  if (!has_private_) {
    throw std::logic_error("public-only key cannot sign");
  }

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
    throw std::runtime_error("EVP_DigestSignInit failed: " + LastOpensslError());
  }

  std::string sig(kSignatureSize, '\0');
  std::size_t sig_len = sig.size();
  if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(sig.data()), &sig_len, reinterpret_cast<const unsigned char*>(message.data()),
                     message.size()) != 1) {
    throw std::runtime_error("EVP_DigestSign failed: " + LastOpensslError());
  }
  sig.resize(sig_len);
  return sig;
}

bool Ed25519Key::Verify(std::string_view message, std::string_view signature) const {
  if (signature.size() != kSignatureSize) {
    return false;
  }

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
    return false;
  }
  const int rc = EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
                                  reinterpret_cast<const unsigned char*>(message.data()), message.size());
  ERR_clear_error();
  return rc == 1;
}

bool VerifyEd25519(std::string_view raw_public_key, std::string_view message, std::string_view signature) {
  if (raw_public_key.size() != kPublicKeySize) {
    return false;
  }
  return Ed25519Key::FromRawPublic(raw_public_key).Verify(message, signature);
}

} // namespace provgate::crypto
