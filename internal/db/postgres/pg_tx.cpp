#include "pg_tx.hpp"

#include <algorithm>
#include <string>

#include "internal/observability/logging.hpp"

namespace optimist::db::postgres {

namespace {

// SQLSTATE codes the protocol cares about
constexpr const char* kUniqueViolation      = "23505";
constexpr const char* kSerializationFailure = "40001";
constexpr const char* kDeadlockDetected     = "40P01";
constexpr const char* kLockNotAvailable     = "55P03";
constexpr const char* kQueryCanceled        = "57014";

} // namespace

void PgTransaction::Canceller::operator()() const {
  try {
    conn->cancel_query();
  } catch (const std::exception& e) {
    OPTIMIST_LOG_WARN("postgres cancel request failed", {observability::StringField("error", e.what())});
  }
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, IsolationLevel isolation, util::Cancellation cancel, const PgOptions& options)
    : isolation_(isolation), cancel_(std::move(cancel)) {
  conn_ = pool->Acquire(cancel_);
  tx_   = std::make_unique<pqxx::work>(*conn_);

  auto statement_timeout = options.statement_timeout;
  if (auto remaining = cancel_.Remaining()) {
    statement_timeout = std::min(statement_timeout, std::max(*remaining, std::chrono::milliseconds(1)));
  }

  // must precede any query of the transaction
  tx_->exec(std::string("SET TRANSACTION ISOLATION LEVEL ") + ToSql(isolation_));
  tx_->exec("SET LOCAL statement_timeout = " + std::to_string(statement_timeout.count()));
  tx_->exec("SET LOCAL lock_timeout = " + std::to_string(options.lock_timeout.count()));

  canceller_ = std::make_unique<std::stop_callback<Canceller>>(cancel_.Token(), Canceller{conn_.get()});
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    auto result = Rollback();
    if (!result) {
      OPTIMIST_LOG_WARN("postgres rollback on destroy failed", {observability::StringField("error", result.message)});
    }
  }
}

Result PgTransaction::Translate(const char* what, const std::exception& e) {
  const std::string message = std::string(what) + ": " + e.what();

  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return Result::Err(ErrorCode::ConnectionError, message);
  }

  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const std::string state = sql->sqlstate();
    if (state == kUniqueViolation) return Result::Err(ErrorCode::AlreadyExists, message);
    if (state == kSerializationFailure) return Result::Err(ErrorCode::SerializationFailure, message);
    if (state == kDeadlockDetected) return Result::Err(ErrorCode::Conflict, message);
    if (state == kLockNotAvailable) return Result::Err(ErrorCode::Busy, message);
    if (state == kQueryCanceled) return Result::Err(ErrorCode::Timeout, message);
    if (state.rfind("23", 0) == 0) return Result::Err(ErrorCode::ConstraintViolation, message);
    return Result::Err(ErrorCode::StatementError, message);
  }

  return Result::Err(ErrorCode::InternalError, message);
}

Result PgTransaction::Commit() {
  if (finished_) return Result::Err(ErrorCode::StatementError, "commit: transaction already finished");

  finished_ = true;
  canceller_.reset();
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    return Translate("commit", e);
  }
  committed_ = true;
  return Result::Ok();
}

Result PgTransaction::Rollback() {
  if (finished_) return Result::Ok();

  finished_ = true;
  canceller_.reset();
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    return Translate("rollback", e);
  }
  return Result::Ok();
}

}
