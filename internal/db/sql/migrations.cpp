#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace optimist::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  std::int64_t step = 0;
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
    ++step;
  }
  OPTIMIST_LOG_DEBUG("schema migrations applied", {observability::IntField("statements", step)});
}

std::vector<std::string> SqliteEntitySchema() {
  return {
      "CREATE TABLE IF NOT EXISTS entity (primary_key TEXT NOT NULL PRIMARY KEY, version INTEGER NOT NULL);",
      "SELECT primary_key,version FROM entity LIMIT 1;",
  };
}

std::vector<std::string> PostgresEntitySchema(const std::string& quoted_schema) {
  return {
      "CREATE SCHEMA IF NOT EXISTS " + quoted_schema + ";",
      "CREATE TABLE IF NOT EXISTS " + quoted_schema + ".entity (primary_key UUID NOT NULL PRIMARY KEY, version BIGINT NOT NULL);",
      "SELECT primary_key,version FROM " + quoted_schema + ".entity LIMIT 1;",
  };
}

} // namespace optimist::db::sql
