#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/race/scenario.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using optimist::db::ErrorCode;
using optimist::db::IsolationLevel;
using optimist::db::Repository;
using optimist::db::model::EntityRecord;
using optimist::race::HoldMode;
using optimist::race::WriterStatus;
using optimist::util::Cancellation;

namespace rc = optimist::runtime::config;

constexpr std::chrono::milliseconds kLockTimeout{300};

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  std::function<void()>                        cleanup;
};

std::shared_ptr<Repository> Build(rc::RuntimeConfig config) {
  optimist::config::ConfigLoader::ApplyDefaults(config);
  *config.mutable_database()->mutable_lock_timeout() = optimist::util::FromMillis(kLockTimeout);
  optimist::config::ConfigLoader::Validate(config);
  return optimist::factory::BuildRepository(config);
}

EntityRecord Record(const std::string& id, uint64_t version) {
  EntityRecord r;
  r.primary_key = id;
  r.version     = version;
  return r;
}

void VerifyEntityLifecycle(Repository& repo) {
  const auto id = optimist::util::ToString(optimist::util::GenerateUUID());
  {
    auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::After(5s));
    assert(repo.InsertEntity(*tx, Record(id, 1)).affected_rows == 1);

    EntityRecord read;
    assert(repo.GetEntity(*tx, id, read));
    assert(read.primary_key == id);
    assert(read.version == 1);
    assert(tx->Commit());
    assert(tx->IsCommitted());
  }
  {
    auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::After(5s));
    assert(repo.InsertEntity(*tx, Record(id, 1)).code == ErrorCode::AlreadyExists);
  }
  {
    auto tx = repo.Begin(IsolationLevel::kRepeatableRead, Cancellation::After(5s));
    assert(repo.AdvanceVersion(*tx, id, 2).affected_rows == 0);
    assert(repo.AdvanceVersion(*tx, id, 1).affected_rows == 1);
    assert(repo.AdvanceVersion(*tx, id, 1).affected_rows == 0);
    assert(tx->Commit());
  }
  {
    auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::After(5s));
    assert(repo.DeleteEntity(*tx, id).affected_rows == 1);
    assert(repo.DeleteEntity(*tx, id).affected_rows == 0);

    EntityRecord read;
    assert(repo.GetEntity(*tx, id, read).code == ErrorCode::NotFound);
    assert(tx->Commit());
    assert(tx->Commit().code == ErrorCode::StatementError);
  }
}

void VerifyRollbackBehavior(Repository& repo) {
  const auto id = optimist::util::ToString(optimist::util::GenerateUUID());
  {
    auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::After(5s));
    assert(repo.InsertEntity(*tx, Record(id, 1)));
    assert(tx->Commit());
  }
  {
    auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::After(5s));
    assert(repo.AdvanceVersion(*tx, id, 1).affected_rows == 1);
    assert(tx->Rollback());
    assert(tx->Rollback());
  }
  {
    // destroyed without commit
    auto tx = repo.Begin(IsolationLevel::kSerializable, Cancellation::After(5s));
    assert(repo.AdvanceVersion(*tx, id, 1).affected_rows == 1);
  }
  auto         tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::After(5s));
  EntityRecord read;
  assert(repo.GetEntity(*tx, id, read));
  assert(read.version == 1);
  assert(repo.DeleteEntity(*tx, id).affected_rows == 1);
  assert(tx->Commit());
}

void VerifyScenarioInReleaseMode(const std::shared_ptr<Repository>& repo) {
  optimist::race::ScenarioOptions options;
  options.hold_mode  = HoldMode::kReleaseFirstTransaction;
  options.hold_delay = 50ms;
  options.timeout    = 20s;

  optimist::race::ScenarioRunner runner(repo);
  const auto                     report = runner.Run(options);
  if (!report.passed) std::cerr << optimist::race::Describe(report);

  assert(report.passed);
  assert(report.conflict_observed);
  assert(report.final_version == 3);
}

// A finished read leaves no lock behind: a writer on another thread gets
// through well inside the lock timeout.
void VerifyReadDoesNotBlockWriter(const std::shared_ptr<Repository>& repo) {
  for (auto level : {IsolationLevel::kReadCommitted, IsolationLevel::kRepeatableRead, IsolationLevel::kSerializable}) {
    optimist::core::RecordStore store(repo, level);
    const auto                  key = optimist::util::GenerateUUID();
    store.Create(key, Cancellation::After(5s));
    assert(store.Read(key, Cancellation::After(5s)).version == 1);

    std::uint64_t      affected = 0;
    std::exception_ptr error;
    std::thread        writer([&] {
      try {
        affected = store.Advance(key, 1, Cancellation::After(5s));
      } catch (const std::exception&) {
        error = std::current_exception();
      }
    });
    writer.join();

    if (error) {
      try {
        std::rethrow_exception(error);
      } catch (const std::exception& e) {
        std::cerr << "writer after read at " << optimist::db::ToString(level) << ": " << e.what() << "\n";
      }
    }
    assert(!error);
    assert(affected == 1);
    assert(store.Read(key, Cancellation::After(5s)).version == 2);
    assert(store.Delete(key, Cancellation::After(5s)) == 1);
  }
}

// Holding the first transaction open: lock-free stores still produce one
// conflict, lock-holding stores make the peer give up on the lock.
void VerifyHoldModeCharacterization(const std::shared_ptr<Repository>& repo) {
  auto store = std::make_shared<optimist::core::RecordStore>(repo, IsolationLevel::kReadCommitted);
  auto key   = optimist::util::GenerateUUID();
  store->Create(key, Cancellation::After(5s));
  assert(store->Advance(key, 1, Cancellation::After(5s)) == 1);

  optimist::race::RaceCoordinator coordinator(store, optimist::race::RaceOptions{.hold_delay = 50ms, .hold_mode = HoldMode::kHoldFirstTransaction});
  const auto                      report = coordinator.Race(key, 2, Cancellation::After(20s));

  assert(report.CommittedAdvances() == 1);
  assert(report.Count(WriterStatus::kOk) == 1);
  if (repo->HoldsWriteLocks()) {
    assert(report.Count(WriterStatus::kFailed) == 1);
    bool timed_out = false;
    try {
      report.RethrowFirstError();
    } catch (const optimist::util::Timeout&) {
      timed_out = true;
    }
    assert(timed_out);
  } else {
    assert(report.Count(WriterStatus::kConflict) == 1);
  }

  assert(store->Read(key, Cancellation::After(5s)).version == 3);
  assert(store->Delete(key, Cancellation::After(5s)) == 1);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name            = "memory",
      .make_repository = []() { return Build(rc::RuntimeConfig{}); },
      .cleanup         = []() {},
  };
}

#if OPTIMIST_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto dir  = std::filesystem::temp_directory_path() / "optimist_repository_parity";
  const auto path = dir / "entity.db";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  return BackendFactory{
      .name = "sqlite",
      .make_repository =
          [path]() {
            rc::RuntimeConfig config;
            config.mutable_database()->mutable_sqlite()->set_path(path.string());
            return Build(config);
          },
      .cleanup = [dir]() { std::filesystem::remove_all(dir); },
  };
}
#endif

#if OPTIMIST_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("OPTIMIST_TEST_POSTGRES_URI");
  if (uri == nullptr || *uri == '\0') {
    throw std::runtime_error("OPTIMIST_TEST_POSTGRES_URI not set");
  }

  const std::string conninfo = uri;
  return BackendFactory{
      .name = "postgres",
      .make_repository =
          [conninfo]() {
            rc::RuntimeConfig config;
            auto*             pg = config.mutable_database()->mutable_postgres();
            pg->set_connection_uri(conninfo);
            pg->set_schema("optimist_test");
            return Build(config);
          },
      .cleanup = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();
  assert(std::string(repo->BackendName()) == backend.name);

  VerifyEntityLifecycle(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyReadDoesNotBlockWriter(repo);
  VerifyScenarioInReleaseMode(repo);
  VerifyHoldModeCharacterization(repo);

  // bootstrap is idempotent
  repo = backend.make_repository();
  VerifyEntityLifecycle(*repo);

  repo.reset();
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if OPTIMIST_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if OPTIMIST_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "optimist_integration_repository_parity: pass\n";
  return 0;
}
