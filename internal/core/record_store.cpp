#include "record_store.hpp"

#include "db_errors.hpp"
#include "internal/observability/logging.hpp"

namespace optimist::core {

using observability::StringField;
using observability::UintField;

RecordStore::RecordStore(std::shared_ptr<db::Repository> repository, db::IsolationLevel isolation)
    : repository_(repository), isolation_(isolation), updater_(std::move(repository)) {
}

std::unique_ptr<db::Transaction> RecordStore::BeginTransaction(const util::Cancellation& cancel) {
  return repository_->Begin(isolation_, cancel);
}

void RecordStore::Commit(db::Transaction& tx, const util::Cancellation& cancel, const std::string& context) {
  cancel.ThrowIfCancelled(context);
  ThrowIfDbError(tx.Commit(), context + " commit");
}

model::Entity RecordStore::Create(const util::UUID& key, const util::Cancellation& cancel) {
  const auto id = util::ToString(key);
  auto       tx = BeginTransaction(cancel);

  db::model::EntityRecord record;
  record.primary_key = id;
  record.version     = 1;
  ThrowIfDbError(repository_->InsertEntity(*tx, record), "create " + id);
  Commit(*tx, cancel, "create " + id);

  OPTIMIST_LOG_DEBUG("entity created", {StringField("key", id)});
  return model::Entity{.primary_key = key, .version = record.version};
}

model::Entity RecordStore::Read(const util::UUID& key, const util::Cancellation& cancel) {
  const auto id = util::ToString(key);
  auto       tx = BeginTransaction(cancel);

  db::model::EntityRecord record;
  const auto              result = repository_->GetEntity(*tx, id, record);

  // read-only: never commit
  const auto rollback = tx->Rollback();
  ThrowIfDbError(result, "read " + id);
  ThrowIfDbError(rollback, "read " + id + " rollback");

  return model::Entity{.primary_key = key, .version = record.version};
}

std::uint64_t RecordStore::Advance(const util::UUID& key, std::uint64_t expected_version, const util::Cancellation& cancel) {
  const auto id       = util::ToString(key);
  auto       tx       = BeginTransaction(cancel);
  const auto affected = updater_.TryAdvance(*tx, key, expected_version);
  Commit(*tx, cancel, "advance " + id);
  return affected;
}

std::uint64_t RecordStore::Delete(const util::UUID& key, const util::Cancellation& cancel) {
  const auto id     = util::ToString(key);
  auto       tx     = BeginTransaction(cancel);
  const auto result = repository_->DeleteEntity(*tx, id);
  ThrowIfDbError(result, "delete " + id);
  Commit(*tx, cancel, "delete " + id);

  OPTIMIST_LOG_DEBUG("entity deleted", {StringField("key", id), UintField("affected", result.affected_rows)});
  return result.affected_rows;
}

} // namespace optimist::core
