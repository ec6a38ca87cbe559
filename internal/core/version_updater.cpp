#include "version_updater.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace optimist::core {

VersionUpdater::VersionUpdater(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::uint64_t VersionUpdater::TryAdvance(db::Transaction& tx, const util::UUID& key, std::uint64_t expected_version) const {
  const auto id     = util::ToString(key);
  const auto result = repository_->AdvanceVersion(tx, id, expected_version);
  ThrowIfDbError(result, "advance version of " + id);

  // primary key match: anything above one row means the table is broken
  if (result.affected_rows > 1) {
    throw util::InvalidState("advance version of " + id + " changed " + std::to_string(result.affected_rows) + " rows");
  }

  OPTIMIST_LOG_DEBUG("conditional update", {observability::StringField("key", id), observability::UintField("expected_version", expected_version),
                                            observability::UintField("affected", result.affected_rows)});
  return result.affected_rows;
}

} // namespace optimist::core
