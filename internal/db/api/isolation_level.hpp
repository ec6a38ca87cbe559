#pragma once

#include <string>
#include <string_view>

namespace optimist::db {

/*
  SQL transaction isolation levels.

  Backends map these onto what they support:
    Postgres: SET TRANSACTION ISOLATION LEVEL ... (READ UNCOMMITTED behaves as READ COMMITTED)
    SQLite:   BEGIN DEFERRED for the two weak levels, BEGIN IMMEDIATE otherwise
    Memory:   statement snapshot for the two weak levels, transaction snapshot otherwise
*/
enum class IsolationLevel {
  kReadUncommitted = 0,
  kReadCommitted,
  kRepeatableRead,
  kSerializable,
};

// "READ COMMITTED" etc, as spelled in SQL
const char* ToSql(IsolationLevel level);

// "read_committed" etc
const char* ToString(IsolationLevel level);

// Accepts "read_committed", "READ COMMITTED", "ReadCommitted".
// Throws std::invalid_argument on anything else.
IsolationLevel ParseIsolationLevel(std::string_view text);

// true when every statement reads the latest committed data
inline bool UsesStatementSnapshot(IsolationLevel level) {
  return level == IsolationLevel::kReadUncommitted || level == IsolationLevel::kReadCommitted;
}

} // namespace optimist::db
