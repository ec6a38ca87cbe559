#pragma once

#include <string>
#include <vector>

namespace optimist::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order.
  Every statement must be idempotent (IF NOT EXISTS); a failure aborts
  the run and propagates the executor's exception.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Entity table DDL per backend. Postgres statements are schema qualified.
std::vector<std::string> SqliteEntitySchema();
std::vector<std::string> PostgresEntitySchema(const std::string& quoted_schema);

} // namespace optimist::db::sql
