#pragma once

#include <chrono>
#include <memory>
#include <pqxx/pqxx>
#include <stop_token>

#include "internal/db/api/transaction.hpp"
#include "internal/util/cancellation.hpp"
#include "pg_pool.hpp"

namespace optimist::db::postgres {

struct PgOptions {
  std::chrono::milliseconds statement_timeout{10000};
  std::chrono::milliseconds lock_timeout{5000};
};

/*
  pqxx::work on a pooled connection.

  Right after BEGIN the transaction sets its isolation level,
  statement_timeout (capped by the time left on the cancellation) and
  lock_timeout. Cancel() sends a cancel request for the running query.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, IsolationLevel isolation, util::Cancellation cancel, const PgOptions& options);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  const util::Cancellation& Cancel() const { return cancel_; }

  Result Commit() override;
  Result Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsFinished() const override { return finished_; }
  IsolationLevel Isolation() const override { return isolation_; }

  // maps a libpqxx exception onto a portable result
  static Result Translate(const char* what, const std::exception& e);

private:
  struct Canceller {
    pqxx::connection* conn;
    void operator()() const;
  };

  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  IsolationLevel isolation_;
  util::Cancellation cancel_;
  std::unique_ptr<std::stop_callback<Canceller>> canceller_;
  bool committed_ = false;
  bool finished_ = false;
};

}
