#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace optimist::db::postgres {

class PgRepository final : public db::Repository {
public:
  PgRepository(std::shared_ptr<PgPool> pool, PgOptions options = {});

  std::unique_ptr<Transaction> Begin(IsolationLevel isolation, const util::Cancellation& cancel) override;

  Result InsertEntity(Transaction&, const model::EntityRecord&) override;
  Result GetEntity(Transaction&, const std::string& id, model::EntityRecord& out) override;
  Result AdvanceVersion(Transaction&, const std::string& id, uint64_t expected_version) override;
  Result DeleteEntity(Transaction&, const std::string& id) override;

  const char* BackendName() const override { return "postgres"; }
  bool HoldsWriteLocks() const override { return true; }

private:
  std::shared_ptr<PgPool> pool_;
  PgOptions options_;

  static PgTransaction& TX(Transaction& t);
};

}
