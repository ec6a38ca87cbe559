#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace optimist::db::memory {

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result Cancelled(const MemoryTransaction& tx, const char* what) {
  if (tx.IsFinished()) {
    return Result::Err(ErrorCode::StatementError, std::string(what) + ": transaction already finished");
  }
  if (tx.Cancel().IsCancelled()) {
    return Result::Err(ErrorCode::Timeout, std::string(what) + ": transaction cancelled");
  }
  return Result::Ok();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(IsolationLevel isolation, const util::Cancellation& cancel) {
  cancel.ThrowIfCancelled("memory begin");
  return std::make_unique<MemoryTransaction>(*this, isolation, cancel);
}

MemoryRepository::Row MemoryRepository::Lookup(MemoryTransaction& tx, const std::string& id) {
  if (auto it = tx.writes_.find(id); it != tx.writes_.end()) {
    return Row{it->second.row.record, it->second.observed_stamp};
  }

  if (UsesStatementSnapshot(tx.isolation_)) {
    std::scoped_lock lock(mutex_);
    auto it = committed_.rows.find(id);
    return it == committed_.rows.end() ? Row{} : it->second;
  }

  auto it = tx.snapshot_.rows.find(id);
  return it == tx.snapshot_.rows.end() ? Row{} : it->second;
}

Result MemoryRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto& tx = TX(t);
  if (auto check = Cancelled(tx, "insert entity"); !check) return check;

  auto row = Lookup(tx, r.primary_key);
  if (row.record) return Result::Err(ErrorCode::AlreadyExists, "duplicate key " + r.primary_key);

  tx.Stage(r.primary_key, r, row.stamp, true);
  return Result::Ok(1);
}

Result MemoryRepository::GetEntity(Transaction& t, const std::string& id, model::EntityRecord& out) {
  auto& tx = TX(t);
  if (auto check = Cancelled(tx, "get entity"); !check) return check;

  auto row = Lookup(tx, id);
  if (!row.record) return Result::Err(ErrorCode::NotFound, "entity " + id + " not found");

  out = *row.record;
  return Result::Ok();
}

Result MemoryRepository::AdvanceVersion(Transaction& t, const std::string& id, uint64_t expected_version) {
  auto& tx = TX(t);
  if (auto check = Cancelled(tx, "advance version"); !check) return check;

  auto row = Lookup(tx, id);
  if (!row.record || row.record->version != expected_version) return Result::Ok(0);

  auto next = *row.record;
  next.version++;
  tx.Stage(id, next, row.stamp, false);
  return Result::Ok(1);
}

Result MemoryRepository::DeleteEntity(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (auto check = Cancelled(tx, "delete entity"); !check) return check;

  auto row = Lookup(tx, id);
  if (!row.record) return Result::Ok(0);

  tx.Stage(id, std::nullopt, row.stamp, false);
  return Result::Ok(1);
}

}
