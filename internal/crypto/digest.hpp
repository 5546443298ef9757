#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace provgate::crypto {

/*
  Hash primitives over OpenSSL EVP.

  Raw digests are carried in std::string (byte container, same as protobuf
  `bytes`), hex digests are lowercase.
*/

constexpr std::size_t kDigestSize = 32;

std::string Sha256(std::string_view data);
std::string Sha256Hex(std::string_view data);

// HMAC-SHA256(key, data), raw 32 bytes
std::string HmacSha256(std::string_view key, std::string_view data);

std::string ToHex(std::string_view raw);
std::string FromHex(std::string_view hex);

std::string RandomBytes(std::size_t size);

// Constant-time equality for secrets and digests.
bool Equal(std::string_view a, std::string_view b);

} // namespace provgate::crypto
