#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/util/uuid.hpp"

namespace optimist::core {

/*
  VersionUpdater

  The conditional update OCC rests on:

    UPDATE entity SET version = version + 1
     WHERE primary_key = key AND version = expected_version

  evaluated by the store as one statement inside the caller's open
  transaction. Never commits or rolls back; the caller owns the
  transaction boundary.
*/
class VersionUpdater {
 public:
  explicit VersionUpdater(std::shared_ptr<db::Repository> repository);

  // 1 when the row matched and was advanced, 0 for a stale version or a
  // missing key. Store failures are thrown (core::ThrowIfDbError).
  std::uint64_t TryAdvance(db::Transaction& tx, const util::UUID& key, std::uint64_t expected_version) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace optimist::core
