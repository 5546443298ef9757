#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace provgate::util {

/*
  UUID helpers

  Receipt, batch and review ids are RFC4122 v4 UUIDs in canonical text form,
  drawn from the OpenSSL CSPRNG.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace provgate::util
