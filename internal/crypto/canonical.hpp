#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace provgate::crypto {

/*
  Canonical byte encoder used for every digest that crosses a trust boundary.

  Layout: domain || 0x00, then field records in the order the caller writes them.
  Each record is a 1-byte tag followed by
    - strings / bytes : 8-byte big-endian length, raw bytes
    - integers, enums : 8-byte big-endian two's complement
    - doubles         : IEEE-754 bit pattern, 8-byte big-endian

  The encoding never depends on map iteration order or locale; callers are
  responsible for emitting repeated/map content in a fixed order.
*/
class CanonicalWriter {
 public:
  explicit CanonicalWriter(std::string_view domain);

  CanonicalWriter& Bytes(std::uint8_t tag, std::string_view value);
  CanonicalWriter& Int(std::uint8_t tag, std::int64_t value);
  CanonicalWriter& Uint(std::uint8_t tag, std::uint64_t value);
  CanonicalWriter& Double(std::uint8_t tag, double value);

  const std::string& Encoded() const {
    return out_;
  }

  // raw SHA-256 of Encoded()
  std::string Digest() const;

 private:
  void AppendU64(std::uint64_t value);

  std::string out_;
};

} // namespace provgate::crypto
