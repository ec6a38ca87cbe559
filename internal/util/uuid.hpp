#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace optimist::util {

/*
  UUID helpers

  Entity primary keys are raw 16 byte RFC4122 UUIDs.
  Storage backends keep the canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace optimist::util
