#pragma once

#include <memory>
#include <stop_token>

#include "internal/db/api/transaction.hpp"
#include "internal/util/cancellation.hpp"
#include "sqlite_db.hpp"

namespace optimist::db::sqlite {

/*
  SQLite transaction wrapper on a dedicated connection.

  READ UNCOMMITTED / READ COMMITTED -> BEGIN DEFERRED (write lock taken by
  the first write statement). REPEATABLE READ / SERIALIZABLE -> BEGIN
  IMMEDIATE (write lock taken up front).

  Lock waits are bounded by min(lock timeout, time left on the
  cancellation). Cancel() interrupts the running statement.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, IsolationLevel isolation, util::Cancellation cancel,
                    std::chrono::milliseconds lock_timeout);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  const util::Cancellation& Cancel() const { return cancel_; }

  Result Commit() override;
  Result Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsFinished() const override { return finished_; }
  IsolationLevel Isolation() const override { return isolation_; }

private:
  struct Interrupter {
    sqlite3* db;
    void operator()() const { sqlite3_interrupt(db); }
  };

  static int OnProgress(void* self);

  std::shared_ptr<SqliteDB> db_;
  IsolationLevel isolation_;
  util::Cancellation cancel_;
  std::unique_ptr<std::stop_callback<Interrupter>> interrupt_;
  bool committed_ = false;
  bool finished_ = false;
};

}
