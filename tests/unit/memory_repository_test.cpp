#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using optimist::db::ErrorCode;
using optimist::db::IsolationLevel;
using optimist::db::memory::MemoryRepository;
using optimist::db::model::EntityRecord;
using optimist::util::Cancellation;

EntityRecord Record(const std::string& id, uint64_t version) {
  EntityRecord r;
  r.primary_key = id;
  r.version     = version;
  return r;
}

void Seed(MemoryRepository& repo, const std::string& id, uint64_t version) {
  auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  assert(repo.InsertEntity(*tx, Record(id, version)).affected_rows == 1);
  assert(tx->Commit());
}

uint64_t VersionOf(MemoryRepository& repo, const std::string& id) {
  auto         tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  EntityRecord out;
  assert(repo.GetEntity(*tx, id, out));
  return out.version;
}

void TestConditionalUpdateMatchesOnlyCurrentVersion() {
  MemoryRepository repo;
  Seed(repo, "k", 1);

  auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  assert(repo.AdvanceVersion(*tx, "k", 2).affected_rows == 0);
  assert(repo.AdvanceVersion(*tx, "k", 1).affected_rows == 1);
  // own write is visible: version is 2 inside the transaction
  assert(repo.AdvanceVersion(*tx, "k", 1).affected_rows == 0);
  assert(repo.AdvanceVersion(*tx, "missing", 1).affected_rows == 0);
  assert(tx->Commit());

  assert(VersionOf(repo, "k") == 2);
}

void TestUncommittedWritesAreInvisibleAndRollbackDiscards() {
  MemoryRepository repo;
  Seed(repo, "k", 1);

  auto writer = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  assert(repo.AdvanceVersion(*writer, "k", 1).affected_rows == 1);
  assert(VersionOf(repo, "k") == 1);

  assert(writer->Rollback());
  assert(writer->IsFinished());
  assert(!writer->IsCommitted());
  assert(VersionOf(repo, "k") == 1);
}

void TestFirstCommitterWins() {
  MemoryRepository repo;
  Seed(repo, "k", 2);

  auto a = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  auto b = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  assert(repo.AdvanceVersion(*a, "k", 2).affected_rows == 1);
  assert(repo.AdvanceVersion(*b, "k", 2).affected_rows == 1);

  assert(a->Commit());
  const auto lost = b->Commit();
  assert(lost.code == ErrorCode::SerializationFailure);
  assert(b->IsFinished());

  assert(VersionOf(repo, "k") == 3);
}

void TestReadCommittedSeesLatestCommitRepeatableReadDoesNot() {
  MemoryRepository repo;
  Seed(repo, "k", 1);

  auto rc = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  auto rr = repo.Begin(IsolationLevel::kRepeatableRead, Cancellation::None());

  {
    auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
    assert(repo.AdvanceVersion(*tx, "k", 1).affected_rows == 1);
    assert(tx->Commit());
  }

  EntityRecord out;
  assert(repo.GetEntity(*rc, "k", out));
  assert(out.version == 2);
  assert(repo.GetEntity(*rr, "k", out));
  assert(out.version == 1);

  // the stale snapshot can still match, but commit rejects it
  assert(repo.AdvanceVersion(*rr, "k", 1).affected_rows == 1);
  assert(rr->Commit().code == ErrorCode::SerializationFailure);
}

void TestInsertDuplicateAndDelete() {
  MemoryRepository repo;
  Seed(repo, "k", 1);

  auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  assert(repo.InsertEntity(*tx, Record("k", 1)).code == ErrorCode::AlreadyExists);
  assert(repo.DeleteEntity(*tx, "k").affected_rows == 1);
  assert(repo.DeleteEntity(*tx, "k").affected_rows == 0);

  EntityRecord out;
  assert(repo.GetEntity(*tx, "k", out).code == ErrorCode::NotFound);
  assert(tx->Commit());

  // concurrent inserts of a fresh key: the second commit sees a duplicate
  auto a = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  auto b = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  assert(repo.InsertEntity(*a, Record("fresh", 1)));
  assert(repo.InsertEntity(*b, Record("fresh", 1)));
  assert(a->Commit());
  assert(b->Commit().code == ErrorCode::AlreadyExists);
}

void TestFinishedAndCancelledTransactions() {
  MemoryRepository repo;
  Seed(repo, "k", 1);

  auto tx = repo.Begin(IsolationLevel::kReadCommitted, Cancellation::None());
  assert(tx->Commit());
  assert(tx->Commit().code == ErrorCode::StatementError);
  assert(tx->Rollback());
  assert(repo.AdvanceVersion(*tx, "k", 1).code == ErrorCode::StatementError);

  auto cancel    = Cancellation::None();
  auto cancelled = repo.Begin(IsolationLevel::kReadCommitted, cancel);
  assert(repo.AdvanceVersion(*cancelled, "k", 1).affected_rows == 1);
  cancel.Cancel();
  assert(repo.AdvanceVersion(*cancelled, "k", 1).code == ErrorCode::Timeout);
  assert(cancelled->Commit().code == ErrorCode::Timeout);
  assert(VersionOf(repo, "k") == 1);

  bool threw = false;
  try {
    (void)repo.Begin(IsolationLevel::kReadCommitted, cancel);
  } catch (const optimist::util::Timeout&) {
    threw = true;
  }
  assert(threw);
}

void TestDestructorRollsBack() {
  MemoryRepository repo;
  Seed(repo, "k", 1);
  {
    auto tx = repo.Begin(IsolationLevel::kSerializable, Cancellation::None());
    assert(repo.AdvanceVersion(*tx, "k", 1).affected_rows == 1);
  }
  assert(VersionOf(repo, "k") == 1);
}

} // namespace

int main() {
  TestConditionalUpdateMatchesOnlyCurrentVersion();
  TestUncommittedWritesAreInvisibleAndRollbackDiscards();
  TestFirstCommitterWins();
  TestReadCommittedSeesLatestCommitRepeatableReadDoesNot();
  TestInsertDuplicateAndDelete();
  TestFinishedAndCancelledTransactions();
  TestDestructorRollsBack();

  std::cout << "optimist_unit_memory_repository: pass\n";
  return 0;
}
