#pragma once

#include <cstdint>

#include "internal/util/uuid.hpp"

namespace optimist::model {

// The versioned row. version starts at 1 and only ever grows by one.
struct Entity {
  util::UUID    primary_key{};
  std::uint64_t version = 0;
};

} // namespace optimist::model
