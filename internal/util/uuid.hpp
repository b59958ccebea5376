#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace chunkcam::util {

/*
  UUID helpers

  Queue item ids and device identities are RFC4122 v4 UUIDs in their
  canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace chunkcam::util
