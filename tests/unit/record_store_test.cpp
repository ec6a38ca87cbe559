#include "internal/core/record_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using optimist::core::RecordStore;
using optimist::db::IsolationLevel;
using optimist::db::Repository;
using optimist::db::Result;
using optimist::db::Transaction;
using optimist::db::memory::MemoryRepository;
using optimist::util::Cancellation;

struct Counters {
  std::atomic<int> begun{0};
  std::atomic<int> commits{0};
  std::atomic<int> rollbacks{0};
};

class RecordingTransaction : public Transaction {
 public:
  RecordingTransaction(std::unique_ptr<Transaction> inner, Counters& counters) : inner_(std::move(inner)), counters_(counters) {
  }

  Transaction& Inner() {
    return *inner_;
  }

  Result Commit() override {
    ++counters_.commits;
    return inner_->Commit();
  }

  Result Rollback() override {
    if (!inner_->IsFinished()) ++counters_.rollbacks;
    return inner_->Rollback();
  }

  bool IsCommitted() const override {
    return inner_->IsCommitted();
  }

  bool IsFinished() const override {
    return inner_->IsFinished();
  }

  IsolationLevel Isolation() const override {
    return inner_->Isolation();
  }

 private:
  std::unique_ptr<Transaction> inner_;
  Counters&                    counters_;
};

class RecordingRepository : public Repository {
 public:
  std::unique_ptr<Transaction> Begin(IsolationLevel isolation, const Cancellation& cancel) override {
    ++counters.begun;
    last_isolation = isolation;
    return std::make_unique<RecordingTransaction>(inner_.Begin(isolation, cancel), counters);
  }

  Result InsertEntity(Transaction& tx, const optimist::db::model::EntityRecord& record) override {
    return inner_.InsertEntity(Unwrap(tx), record);
  }

  Result GetEntity(Transaction& tx, const std::string& id, optimist::db::model::EntityRecord& out) override {
    return inner_.GetEntity(Unwrap(tx), id, out);
  }

  Result AdvanceVersion(Transaction& tx, const std::string& id, uint64_t expected_version) override {
    return inner_.AdvanceVersion(Unwrap(tx), id, expected_version);
  }

  Result DeleteEntity(Transaction& tx, const std::string& id) override {
    return inner_.DeleteEntity(Unwrap(tx), id);
  }

  const char* BackendName() const override {
    return "recording";
  }

  bool HoldsWriteLocks() const override {
    return false;
  }

  Counters                    counters;
  std::atomic<IsolationLevel> last_isolation{IsolationLevel::kReadUncommitted};

 private:
  static Transaction& Unwrap(Transaction& tx) {
    return static_cast<RecordingTransaction&>(tx).Inner();
  }

  MemoryRepository inner_;
};

void TestCreateReadAdvanceRead() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto cancel = Cancellation::After(5s);
  RecordStore store(repo, IsolationLevel::kReadCommitted);

  const auto key    = optimist::util::GenerateUUID();
  const auto entity = store.Create(key, cancel);
  assert(entity.version == 1);
  assert(entity.primary_key == key);
  assert(store.Read(key, cancel).version == 1);

  assert(store.Advance(key, 1, cancel) == 1);
  assert(store.Read(key, cancel).version == 2);
}

void TestStaleAdvanceIsNotReapplied() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto cancel = Cancellation::After(5s);
  RecordStore store(repo, IsolationLevel::kReadCommitted);

  const auto key = optimist::util::GenerateUUID();
  store.Create(key, cancel);
  assert(store.Advance(key, 1, cancel) == 1);
  assert(store.Advance(key, 1, cancel) == 0);
  assert(store.Read(key, cancel).version == 2);
}

void TestVersionGrowsByOnePerSuccess() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto cancel = Cancellation::After(5s);
  RecordStore store(repo, IsolationLevel::kSerializable);

  const auto key = optimist::util::GenerateUUID();
  store.Create(key, cancel);

  uint64_t expected = 1;
  for (int i = 0; i < 20; ++i) {
    // every other call uses a stale version and must not move the row
    const auto stale = expected - 1;
    assert(store.Advance(key, stale, cancel) == 0);
    assert(store.Advance(key, expected, cancel) == 1);
    ++expected;
    assert(store.Read(key, cancel).version == expected);
  }
}

void TestDeleteThenReadIsNotFound() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto cancel = Cancellation::After(5s);
  RecordStore store(repo, IsolationLevel::kReadCommitted);

  const auto key = optimist::util::GenerateUUID();
  store.Create(key, cancel);
  assert(store.Delete(key, cancel) == 1);
  assert(store.Delete(key, cancel) == 0);

  bool threw = false;
  try {
    store.Read(key, cancel);
  } catch (const optimist::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestDuplicateCreate() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto cancel = Cancellation::After(5s);
  RecordStore store(repo, IsolationLevel::kReadCommitted);

  const auto key = optimist::util::GenerateUUID();
  store.Create(key, cancel);

  bool threw = false;
  try {
    store.Create(key, cancel);
  } catch (const optimist::util::DuplicateKey&) {
    threw = true;
  }
  assert(threw);
  assert(store.Read(key, cancel).version == 1);
}

void TestReadAlwaysRollsBackAndUsesConfiguredIsolation() {
  auto repo   = std::make_shared<RecordingRepository>();
  auto cancel = Cancellation::After(5s);
  RecordStore store(repo, IsolationLevel::kRepeatableRead);
  assert(store.Isolation() == IsolationLevel::kRepeatableRead);
  assert(&store.Backend() == repo.get());

  const auto key = optimist::util::GenerateUUID();
  store.Create(key, cancel);
  assert(repo->counters.commits == 1);
  assert(repo->last_isolation.load() == IsolationLevel::kRepeatableRead);

  store.Read(key, cancel);
  assert(repo->counters.commits == 1);
  assert(repo->counters.rollbacks == 1);

  // a read that finds nothing is rolled back too
  bool threw = false;
  try {
    store.Read(optimist::util::GenerateUUID(), cancel);
  } catch (const optimist::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(repo->counters.commits == 1);
  assert(repo->counters.rollbacks == 2);
}

void TestCancelledOperationsTimeOutAndRollBack() {
  auto repo = std::make_shared<MemoryRepository>();
  RecordStore store(repo, IsolationLevel::kReadCommitted);

  const auto key = optimist::util::GenerateUUID();
  store.Create(key, Cancellation::After(5s));

  auto cancel = Cancellation::None();
  auto tx     = store.BeginTransaction(cancel);
  assert(store.TryAdvance(*tx, key, 1) == 1);
  cancel.Cancel();

  bool threw = false;
  try {
    store.Commit(*tx, cancel, "cancelled advance");
  } catch (const optimist::util::Timeout&) {
    threw = true;
  }
  assert(threw);
  tx.reset();
  assert(store.Read(key, Cancellation::After(5s)).version == 1);

  threw = false;
  try {
    store.Advance(key, 1, cancel);
  } catch (const optimist::util::Timeout&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCreateReadAdvanceRead();
  TestStaleAdvanceIsNotReapplied();
  TestVersionGrowsByOnePerSuccess();
  TestDeleteThenReadIsNotFound();
  TestDuplicateCreate();
  TestReadAlwaysRollsBackAndUsesConfiguredIsolation();
  TestCancelledOperationsTimeOutAndRollBack();

  std::cout << "optimist_unit_record_store: pass\n";
  return 0;
}
