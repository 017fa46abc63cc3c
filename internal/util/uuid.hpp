#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace zget::util {

/*
  UUID helpers

  Queue item ids are random RFC4122 v4 UUIDs in their 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateId() {
  return ToString(GenerateUUID());
}

} // namespace zget::util
