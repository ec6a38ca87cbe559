#include "sqlite_tx.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace optimist::db::sqlite {

namespace {

Result TranslateControl(const SqliteError& e, const char* what) {
  switch (e.Code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, std::string(what) + ": " + e.what());
    case SQLITE_INTERRUPT:
      return Result::Err(ErrorCode::Timeout, std::string(what) + ": " + e.what());
    default:
      return Result::Err(ErrorCode::StatementError, std::string(what) + ": " + e.what());
  }
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, IsolationLevel isolation, util::Cancellation cancel,
                                     std::chrono::milliseconds lock_timeout)
    : db_(std::move(db)), isolation_(isolation), cancel_(std::move(cancel)) {
  auto wait = lock_timeout;
  if (auto remaining = cancel_.Remaining()) wait = std::min(wait, *remaining);
  db_->SetBusyTimeout(wait);

  sqlite3_progress_handler(db_->Handle(), 256, &SqliteTransaction::OnProgress, this);
  interrupt_ = std::make_unique<std::stop_callback<Interrupter>>(cancel_.Token(), Interrupter{db_->Handle()});

  db_->Exec(UsesStatementSnapshot(isolation_) ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    auto result = Rollback();
    if (!result) {
      OPTIMIST_LOG_WARN("sqlite rollback on destroy failed", {observability::StringField("error", result.message)});
    }
  }
  sqlite3_progress_handler(db_->Handle(), 0, nullptr, nullptr);
}

int SqliteTransaction::OnProgress(void* self) {
  // non-zero aborts the running statement with SQLITE_INTERRUPT
  return static_cast<SqliteTransaction*>(self)->cancel_.IsCancelled() ? 1 : 0;
}

Result SqliteTransaction::Commit() {
  if (finished_) return Result::Err(ErrorCode::StatementError, "commit: transaction already finished");

  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    auto result   = TranslateControl(e, "commit");
    auto rollback = Rollback();
    if (!rollback) {
      OPTIMIST_LOG_WARN("sqlite rollback after failed commit failed", {observability::StringField("error", rollback.message)});
    }
    return result;
  }
  committed_ = true;
  finished_  = true;
  return Result::Ok();
}

Result SqliteTransaction::Rollback() {
  if (finished_) return Result::Ok();
  finished_ = true;

  // a failed statement may already have ended the transaction
  if (sqlite3_get_autocommit(db_->Handle())) return Result::Ok();

  // the rollback itself must not be interrupted by an expired deadline
  sqlite3_progress_handler(db_->Handle(), 0, nullptr, nullptr);
  interrupt_.reset();
  try {
    db_->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    return TranslateControl(e, "rollback");
  }
  return Result::Ok();
}

} // namespace optimist::db::sqlite
