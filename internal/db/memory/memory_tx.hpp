#pragma once

#include <string>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "internal/util/cancellation.hpp"
#include "memory_repository.hpp"

namespace optimist::db::memory {

/*
  Transaction = snapshot + write set

  READ UNCOMMITTED / READ COMMITTED read the latest committed state on
  every statement. REPEATABLE READ / SERIALIZABLE read the copy taken at
  Begin(). Both behave as snapshot isolation at commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, IsolationLevel isolation, util::Cancellation cancel);
  ~MemoryTransaction();

  Result Commit() override;
  Result Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsFinished() const override {
    return finished_;
  }
  IsolationLevel Isolation() const override {
    return isolation_;
  }

  const util::Cancellation& Cancel() const {
    return cancel_;
  }

 private:
  friend class MemoryRepository;

  struct PendingWrite {
    MemoryRepository::Row row;       // new value; row.stamp unused
    uint64_t observed_stamp = 0;     // committed stamp the write is based on
    bool     inserted       = false;
  };

  void Stage(const std::string& id, std::optional<model::EntityRecord> value, uint64_t observed_stamp, bool inserted);

  MemoryRepository&                             repo_;
  IsolationLevel                                isolation_;
  util::Cancellation                            cancel_;
  MemoryRepository::State                       snapshot_;
  std::unordered_map<std::string, PendingWrite> writes_;
  bool                                          committed_ = false;
  bool                                          finished_  = false;
};

} // namespace optimist::db::memory
