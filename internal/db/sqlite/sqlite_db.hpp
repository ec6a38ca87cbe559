#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace optimist::db::sqlite {

/*
  Failure reported by sqlite; keeps the primary result code so callers
  can tell lock waits (SQLITE_BUSY) from real errors.
*/
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int rc, const std::string& msg) : std::runtime_error(msg), rc_(rc) {
  }

  int Code() const {
    return rc_;
  }

 private:
  int rc_;
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  Connections are never shared between transactions: each transaction
  opens its own, so two writers really do contend on the database lock.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  // Bound for waiting on another connection's lock
  void SetBusyTimeout(std::chrono::milliseconds timeout);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(std::chrono::milliseconds busy_timeout);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace optimist::db::sqlite
