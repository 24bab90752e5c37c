#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace tsbatch::util {

/*
  UUID helpers

  Correlation identifiers are RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace tsbatch::util
