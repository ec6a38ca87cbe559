#pragma once

#include <memory>
#include <string>

#include "internal/db/api/isolation_level.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/util/cancellation.hpp"

namespace optimist::db {

/*
  Repository abstraction over the versioned entity table.

  CRITICAL GUARANTEES:

  - Every statement runs inside a Transaction obtained from Begin()
  - Reads inside a transaction see its own writes
  - AdvanceVersion is a single conditional statement: the version match
    and the increment are evaluated atomically by the store, so two
    transactions can never both advance the same (id, version) pair
  - Results carry the affected row count (0 or 1 for keyed statements)

  Begin() throws util::ConnectionError when no connection is available
  and util::Timeout when the cancellation already fired. Everything else
  is reported through Result.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(IsolationLevel isolation, const util::Cancellation& cancel) = 0;

  // ---------------------------------------------------------------------
  // Entity
  // ---------------------------------------------------------------------

  // AlreadyExists if the key is taken
  virtual Result InsertEntity(Transaction&, const model::EntityRecord&) = 0;

  // NotFound if absent; fills `out` otherwise
  virtual Result GetEntity(Transaction&, const std::string& id, model::EntityRecord& out) = 0;

  // version = version + 1 WHERE id AND version = expected_version
  virtual Result AdvanceVersion(Transaction&, const std::string& id, uint64_t expected_version) = 0;

  virtual Result DeleteEntity(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Capabilities
  // ---------------------------------------------------------------------

  // "memory", "sqlite", "postgres"
  virtual const char* BackendName() const = 0;

  // true when a conditional update blocks other writers of the row until
  // the transaction ends (postgres row locks, sqlite database lock)
  virtual bool HoldsWriteLocks() const = 0;
};

} // namespace optimist::db
