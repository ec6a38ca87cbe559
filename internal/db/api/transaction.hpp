#pragma once

#include "internal/db/api/isolation_level.hpp"
#include "internal/db/api/result.hpp"

namespace optimist::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Commit() or Rollback() finishes the handle; a second Rollback() is a
    no-op, a Commit() on a finished handle returns StatementError
  - Destructor MUST rollback if not finished
  - A handle is owned by exactly one thread

  SQLite: BEGIN DEFERRED / BEGIN IMMEDIATE on a dedicated connection
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot + write set, validated at commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual Result Commit() = 0;

  // explicit rollback
  virtual Result Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsFinished() const = 0;

  virtual IsolationLevel Isolation() const = 0;
};

} // namespace optimist::db
