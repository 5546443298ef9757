#pragma once

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <string_view>

namespace provgate::crypto {

/*
  Ed25519 key (private or public-only) owned through EVP_PKEY.

  Public keys are exchanged as the raw 32-byte encoding. Signing is not
  thread-safe per key; callers serialize access (see trust::TrustLayer).
*/
class Ed25519Key {
 public:
  static Ed25519Key Generate();
  static Ed25519Key FromPrivatePemFile(const std::string& path);
  static Ed25519Key FromPrivatePem(std::string_view pem);
  static Ed25519Key FromRawPublic(std::string_view raw);

  bool HasPrivate() const {
    return has_private_;
  }

  std::string PublicRaw() const;

  // throws if this is a public-only key
  std::string Sign(std::string_view message) const;

  bool Verify(std::string_view message, std::string_view signature) const;

 private:
  struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const {
      EVP_PKEY_free(key);
    }
  };

  Ed25519Key(EVP_PKEY* key, bool has_private);

  std::shared_ptr<EVP_PKEY> key_;
  bool                      has_private_ = false;
};

// Stateless check used by offline verifiers.
bool VerifyEd25519(std::string_view raw_public_key, std::string_view message, std::string_view signature);

} // namespace provgate::crypto
