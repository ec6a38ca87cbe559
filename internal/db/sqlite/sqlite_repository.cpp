#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace optimist::db::sqlite {

using optimist::db::ErrorCode;
using optimist::db::Result;

namespace {

// finalizes on scope exit
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const { return rc_ == SQLITE_OK && st_ != nullptr; }
  int PrepareCode() const { return rc_; }
  sqlite3_stmt* Get() const { return st_; }

 private:
  sqlite3_stmt* st_ = nullptr;
  int rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

Result Usable(const SqliteTransaction& tx, const char* what) {
    if (tx.IsFinished())
        return Result::Err(ErrorCode::StatementError, std::string(what) + ": transaction already finished");
    if (tx.Cancel().IsCancelled())
        return Result::Err(ErrorCode::Timeout, std::string(what) + ": transaction cancelled");
    return Result::Ok();
}

} // namespace

SqliteRepository::SqliteRepository(std::string path, SqliteOptions options)
    : path_(std::move(path)), options_(options) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(IsolationLevel isolation, const util::Cancellation& cancel) {
    cancel.ThrowIfCancelled("sqlite begin");

    std::shared_ptr<SqliteDB> conn;
    try {
        conn = std::make_shared<SqliteDB>(path_, options_.lock_timeout);
    } catch (const SqliteError& e) {
        if (e.Code() == SQLITE_BUSY || e.Code() == SQLITE_LOCKED)
            throw util::Timeout(std::string("sqlite connect: ") + e.what());
        throw util::ConnectionError(std::string("sqlite connect: ") + e.what());
    }

    try {
        return std::make_unique<SqliteTransaction>(std::move(conn), isolation, cancel, options_.lock_timeout);
    } catch (const SqliteError& e) {
        switch (e.Code()) {
            case SQLITE_BUSY:
            case SQLITE_LOCKED:
                throw util::Timeout(std::string("sqlite begin: lock wait exceeded: ") + e.what());
            case SQLITE_INTERRUPT:
                throw util::Timeout(std::string("sqlite begin: interrupted: ") + e.what());
            default:
                throw util::StatementError(std::string("sqlite begin: ") + e.what());
        }
    }
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_INTERRUPT:
            return Result::Err(ErrorCode::Timeout, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY ||
                sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::StatementError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Entity
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
    auto& tx = TX(t);
    if (auto check = Usable(tx, "insert entity"); !check) return check;
    auto* db = tx.Handle();

    Statement st(db, sql::INSERT_ENTITY);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.Get(), 1, r.primary_key);
    BindU64(st.Get(), 2, r.version);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    return Result::Ok(static_cast<uint64_t>(sqlite3_changes(db)));
}

Result SqliteRepository::GetEntity(Transaction& t, const std::string& id, model::EntityRecord& out) {
    auto& tx = TX(t);
    if (auto check = Usable(tx, "get entity"); !check) return check;
    auto* db = tx.Handle();

    Statement st(db, sql::SELECT_ENTITY);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.Get(), 1, id);

    int rc = sqlite3_step(st.Get());
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "entity " + id + " not found");
    if (rc != SQLITE_ROW) return Translate(db, rc);

    out.primary_key = ColText(st.Get(), 0);
    out.version     = ColU64(st.Get(), 1);
    return Result::Ok();
}

Result SqliteRepository::AdvanceVersion(Transaction& t, const std::string& id, uint64_t expected_version) {
    auto& tx = TX(t);
    if (auto check = Usable(tx, "advance version"); !check) return check;
    auto* db = tx.Handle();

    Statement st(db, sql::ADVANCE_ENTITY_VERSION);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.Get(), 1, id);
    BindU64(st.Get(), 2, expected_version);

    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    return Result::Ok(static_cast<uint64_t>(sqlite3_changes(db)));
}

Result SqliteRepository::DeleteEntity(Transaction& t, const std::string& id) {
    auto& tx = TX(t);
    if (auto check = Usable(tx, "delete entity"); !check) return check;
    auto* db = tx.Handle();

    Statement st(db, sql::DELETE_ENTITY);
    if (!st.Ok()) return Translate(db, st.PrepareCode());

    BindText(st.Get(), 1, id);
    int rc = sqlite3_step(st.Get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    return Result::Ok(static_cast<uint64_t>(sqlite3_changes(db)));
}

} // namespace optimist::db::sqlite
