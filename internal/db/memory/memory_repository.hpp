#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace optimist::db::memory {

class MemoryTransaction;

/*
  In-process store with optimistic, row-stamped transactions.

  - Each committed row carries the commit sequence number that last wrote
    it. Deleted keys keep a tombstone so re-inserts are detected too.
  - A transaction records the stamp it observed for every row it writes;
    Commit() fails with SerializationFailure if any of those rows was
    committed by someone else in the meantime (first committer wins).
  - No row locks: concurrent conditional updates never block each other,
    the loser is found at commit or by its next statement.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin(IsolationLevel isolation, const util::Cancellation& cancel) override;

  Result InsertEntity(Transaction&, const model::EntityRecord&) override;
  Result GetEntity(Transaction&, const std::string& id, model::EntityRecord& out) override;
  Result AdvanceVersion(Transaction&, const std::string& id, uint64_t expected_version) override;
  Result DeleteEntity(Transaction&, const std::string& id) override;

  const char* BackendName() const override {
    return "memory";
  }

  bool HoldsWriteLocks() const override {
    return false;
  }

private:
  friend class MemoryTransaction;

  struct Row {
    std::optional<model::EntityRecord> record;  // nullopt = tombstone
    uint64_t stamp = 0;
  };

  struct State {
    std::unordered_map<std::string, Row> rows;
    uint64_t commit_seq = 0;
  };

  // row as seen by `tx`: own writes first, then its snapshot
  Row Lookup(MemoryTransaction& tx, const std::string& id);

  std::mutex mutex_;
  State committed_;
};

}
