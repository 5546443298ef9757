#include "canonical.hpp"

#include <cstring>

#include "digest.hpp"

namespace provgate::crypto {

CanonicalWriter::CanonicalWriter(std::string_view domain) {
  out_.append(domain.data(), domain.size());
  out_.push_back('\0');
}

void CanonicalWriter::AppendU64(std::uint64_t value) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out_.push_back(static_cast<char>((value >> shift) & 0xFF));
  }
}

CanonicalWriter& CanonicalWriter::Bytes(std::uint8_t tag, std::string_view value) {
  out_.push_back(static_cast<char>(tag));
  AppendU64(value.size());
  out_.append(value.data(), value.size());
  return *this;
}

CanonicalWriter& CanonicalWriter::Int(std::uint8_t tag, std::int64_t value) {
  out_.push_back(static_cast<char>(tag));
  AppendU64(static_cast<std::uint64_t>(value));
  return *this;
}

CanonicalWriter& CanonicalWriter::Uint(std::uint8_t tag, std::uint64_t value) {
  out_.push_back(static_cast<char>(tag));
  AppendU64(value);
  return *this;
}

CanonicalWriter& CanonicalWriter::Double(std::uint8_t tag, double value) {
  std::uint64_t bits = 0;
  static_assert(sizeof(bits) == sizeof(value));
  std::memcpy(&bits, &value, sizeof(bits));
  out_.push_back(static_cast<char>(tag));
  AppendU64(bits);
  return *this;
}

std::string CanonicalWriter::Digest() const {
  return Sha256(out_);
}

} // namespace provgate::crypto
