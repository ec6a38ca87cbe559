#pragma once

#include <cstdint>
#include <string>

namespace optimist::db::model {

/*
  Persistent entity row.

  IMPORTANT:
  - primary_key is immutable once inserted.
  - version starts at 1 and is only ever changed by the conditional
    "version = version + 1 where version = expected" statement.
*/

struct EntityRecord {
  std::string primary_key;  // canonical UUID text

  uint64_t version = 0;
};

}
