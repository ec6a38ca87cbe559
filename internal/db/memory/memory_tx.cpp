#include "memory_tx.hpp"

namespace optimist::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, IsolationLevel isolation, util::Cancellation cancel)
    : repo_(repo), isolation_(isolation), cancel_(std::move(cancel)) {
  if (!UsesStatementSnapshot(isolation_)) {
    std::scoped_lock lock(repo_.mutex_);
    snapshot_ = repo_.committed_; // snapshot copy
  }
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Stage(const std::string& id, std::optional<model::EntityRecord> value, uint64_t observed_stamp, bool inserted) {
  auto it = writes_.find(id);
  if (it != writes_.end()) {
    // keep the stamp of the first read; later writes build on our own row
    it->second.row.record = std::move(value);
    it->second.inserted   = it->second.inserted || inserted;
    return;
  }

  PendingWrite write;
  write.row.record      = std::move(value);
  write.observed_stamp  = observed_stamp;
  write.inserted        = inserted;
  writes_.emplace(id, std::move(write));
}

Result MemoryTransaction::Commit() {
  if (finished_) {
    return Result::Err(ErrorCode::StatementError, "commit: transaction already finished");
  }
  if (cancel_.IsCancelled()) {
    Rollback();
    return Result::Err(ErrorCode::Timeout, "commit: transaction cancelled");
  }

  std::scoped_lock lock(repo_.mutex_);

  for (const auto& [id, write] : writes_) {
    const auto  it      = repo_.committed_.rows.find(id);
    const auto  current = it == repo_.committed_.rows.end() ? 0 : it->second.stamp;
    const bool  live    = it != repo_.committed_.rows.end() && it->second.record.has_value();

    if (current == write.observed_stamp) continue;

    auto result = write.inserted && live
                      ? Result::Err(ErrorCode::AlreadyExists, "commit: duplicate key " + id)
                      : Result::Err(ErrorCode::SerializationFailure, "commit: could not serialize access due to concurrent update of " + id);
    writes_.clear();
    finished_ = true;
    return result;
  }

  if (!writes_.empty()) {
    const auto stamp = ++repo_.committed_.commit_seq;
    for (auto& [id, write] : writes_) {
      auto& row  = repo_.committed_.rows[id];
      row.record = std::move(write.row.record);
      row.stamp  = stamp;
    }
  }

  writes_.clear();
  committed_ = true;
  finished_  = true;
  return Result::Ok();
}

Result MemoryTransaction::Rollback() {
  writes_.clear();
  finished_ = true;
  return Result::Ok();
}

} // namespace optimist::db::memory
