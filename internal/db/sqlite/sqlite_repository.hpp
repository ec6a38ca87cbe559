#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace optimist::db::sqlite {

struct SqliteOptions {
  std::chrono::milliseconds lock_timeout{5000};
};

class SqliteRepository final : public db::Repository {
public:
  // `path` must name a file: every transaction opens its own connection
  explicit SqliteRepository(std::string path, SqliteOptions options = {});

  std::unique_ptr<Transaction> Begin(IsolationLevel isolation, const util::Cancellation& cancel) override;

  Result InsertEntity(Transaction&, const model::EntityRecord&) override;
  Result GetEntity(Transaction&, const std::string& id, model::EntityRecord& out) override;
  Result AdvanceVersion(Transaction&, const std::string& id, uint64_t expected_version) override;
  Result DeleteEntity(Transaction&, const std::string& id) override;

  const char* BackendName() const override { return "sqlite"; }
  bool HoldsWriteLocks() const override { return true; }

private:
  std::string path_;
  SqliteOptions options_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
