#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if OPTIMIST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if OPTIMIST_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace optimist::factory {

namespace config = optimist::runtime::config;

namespace {

#if OPTIMIST_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};

void BootstrapSqliteSchema(const std::string& path, std::chrono::milliseconds lock_timeout) {
  try {
    db::sqlite::SqliteDB            sqlite_db(path, lock_timeout);
    SqliteMigrationExecutor executor(sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteEntitySchema());
  } catch (const db::sqlite::SqliteError& e) {
    throw util::ConnectionError("sqlite bootstrap of " + path + " failed: " + e.what());
  }
}
#endif

#if OPTIMIST_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

// runs on its own connection: pooled sessions prepare statements against
// the entity table, which must exist first
void BootstrapPostgresSchema(const config::PostgresConfig& pg) {
  try {
    pqxx::connection    conn(pg.connection_uri());
    pqxx::work          tx(conn);
    PgMigrationExecutor executor(tx);
    db::sql::RunMigrations(executor, db::sql::PostgresEntitySchema(tx.quote_name(pg.schema())));
    tx.commit();
  } catch (const pqxx::broken_connection& e) {
    throw util::ConnectionError(std::string("postgres bootstrap failed: ") + e.what());
  } catch (const pqxx::sql_error& e) {
    throw util::StatementError(std::string("postgres bootstrap failed: ") + e.what());
  }
}
#endif

} // namespace

db::IsolationLevel ToIsolationLevel(config::IsolationLevel level) {
  switch (level) {
    case config::ISOLATION_LEVEL_READ_UNCOMMITTED:
      return db::IsolationLevel::kReadUncommitted;
    case config::ISOLATION_LEVEL_REPEATABLE_READ:
      return db::IsolationLevel::kRepeatableRead;
    case config::ISOLATION_LEVEL_SERIALIZABLE:
      return db::IsolationLevel::kSerializable;
    case config::ISOLATION_LEVEL_READ_COMMITTED:
    default:
      return db::IsolationLevel::kReadCommitted;
  }
}

race::HoldMode ToHoldMode(config::HoldMode mode) {
  return mode == config::HOLD_MODE_RELEASE_FIRST_TRANSACTION ? race::HoldMode::kReleaseFirstTransaction : race::HoldMode::kHoldFirstTransaction;
}

race::ScenarioOptions BuildScenarioOptions(const config::RuntimeConfig& runtime_config) {
  const auto& scenario = runtime_config.scenario();

  race::ScenarioOptions options;
  options.isolation  = ToIsolationLevel(scenario.isolation_level());
  options.hold_delay = util::ToMillis(scenario.hold_delay());
  options.hold_mode  = ToHoldMode(scenario.hold_mode());
  options.timeout    = util::ToMillis(scenario.timeout());
  if (!scenario.primary_key().empty()) {
    options.primary_key = util::FromString(scenario.primary_key());
  }
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const config::RuntimeConfig& runtime_config) {
  const auto& database     = runtime_config.database();
  const auto  lock_timeout = util::ToMillis(database.lock_timeout());

  if (database.has_sqlite()) {
#if OPTIMIST_DB_SQLITE
    BootstrapSqliteSchema(database.sqlite().path(), lock_timeout);
    OPTIMIST_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(database.sqlite().path(), db::sqlite::SqliteOptions{.lock_timeout = lock_timeout});
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if OPTIMIST_DB_POSTGRES
    const auto& pg = database.postgres();
    BootstrapPostgresSchema(pg);
    auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.schema(), pg.max_connections());
    OPTIMIST_LOG_INFO("repository ready", {observability::StringField("backend", "postgres"), observability::StringField("schema", pg.schema())});
    return std::make_shared<db::postgres::PgRepository>(
        std::move(pool), db::postgres::PgOptions{.statement_timeout = util::ToMillis(database.statement_timeout()), .lock_timeout = lock_timeout});
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  OPTIMIST_LOG_INFO("repository ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace optimist::factory
