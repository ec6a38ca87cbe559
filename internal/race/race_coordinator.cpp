#include "race_coordinator.hpp"

#include <system_error>
#include <thread>

#include "internal/core/conflict_detector.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace optimist::race {

using observability::StringField;
using observability::UintField;

namespace {

// A conflict raised by the store itself (serialization failure, deadlock)
// knows no row counts; report the first attempt's count against nothing
// applied by the second.
[[noreturn]] void RethrowWithCounts(const util::ConcurrentUpdateError& e, std::uint64_t first_count) {
  throw util::ConcurrentUpdateError(e.what(), first_count, 0);
}

} // namespace

const char* ToString(HoldMode mode) {
  switch (mode) {
    case HoldMode::kHoldFirstTransaction:
      return "hold_first_transaction";
    case HoldMode::kReleaseFirstTransaction:
      return "release_first_transaction";
  }
  return "unknown";
}

const char* ToString(WriterStatus status) {
  switch (status) {
    case WriterStatus::kOk:
      return "ok";
    case WriterStatus::kConflict:
      return "conflict";
    case WriterStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

bool RaceReport::ConflictObserved() const {
  return Count(WriterStatus::kConflict) > 0;
}

std::size_t RaceReport::Count(WriterStatus status) const {
  std::size_t n = 0;
  for (const auto& writer : writers) {
    if (writer.status == status) ++n;
  }
  return n;
}

std::uint64_t RaceReport::CommittedAdvances() const {
  std::uint64_t total = 0;
  for (const auto& writer : writers) {
    if (writer.committed) total += writer.second_count;
  }
  return total;
}

void RaceReport::RethrowFirstError() const {
  for (const auto& writer : writers) {
    if (writer.status == WriterStatus::kFailed && writer.error) std::rethrow_exception(writer.error);
  }
}

RaceCoordinator::RaceCoordinator(std::shared_ptr<core::RecordStore> store, RaceOptions options)
    : store_(std::move(store)), options_(options) {
}

RaceReport RaceCoordinator::Race(const util::UUID& key, std::uint64_t expected_version, const util::Cancellation& cancel) {
  RendezvousGate gate(2);
  RaceReport     report;

  OPTIMIST_LOG_INFO("race started", {StringField("key", util::ToString(key)), UintField("expected_version", expected_version),
                                     StringField("hold_mode", ToString(options_.hold_mode)),
                                     StringField("isolation", db::ToString(store_->Isolation())),
                                     StringField("backend", store_->Backend().BackendName())});

  // RunWriter never throws; each thread only touches its own slot
  std::thread writer_a([&] { report.writers[0] = RunWriter("a", gate, key, expected_version, cancel); });
  std::thread writer_b;
  try {
    writer_b = std::thread([&] { report.writers[1] = RunWriter("b", gate, key, expected_version, cancel); });
  } catch (const std::system_error& e) {
    // b never runs: let a through the gate, then surface the error
    OPTIMIST_LOG_ERROR("race writer thread failed to start", {StringField("writer", "b"), StringField("error", e.what())});
    gate.Abandon();
    writer_a.join();
    throw;
  }
  writer_a.join();
  writer_b.join();

  OPTIMIST_LOG_INFO("race finished", {StringField("a", ToString(report.writers[0].status)), StringField("b", ToString(report.writers[1].status)),
                                      UintField("committed_advances", report.CommittedAdvances())});
  return report;
}

WriterOutcome RaceCoordinator::RunWriter(const std::string& name, RendezvousGate& gate, const util::UUID& key, std::uint64_t expected_version,
                                         const util::Cancellation& cancel) const {
  WriterOutcome out;
  out.name = name;

  const auto id      = util::ToString(key);
  bool       arrived = false;

  try {
    auto first_tx   = store_->BeginTransaction(cancel);
    out.first_count = store_->TryAdvance(*first_tx, key, expected_version);
    OPTIMIST_LOG_DEBUG("first attempt", {StringField("writer", name), UintField("affected", out.first_count)});

    if (options_.hold_mode == HoldMode::kReleaseFirstTransaction) {
      core::ThrowIfDbError(first_tx->Rollback(), "writer " + name + " release first transaction");
      first_tx.reset();
    }

    gate.Arrive();
    arrived = true;
    cancel.SleepFor(options_.hold_delay, "writer " + name + " hold");

    auto turn = gate.AwaitTurn(cancel);
    OPTIMIST_LOG_DEBUG("writer has the turn", {StringField("writer", name)});

    if (first_tx) {
      core::ThrowIfDbError(first_tx->Rollback(), "writer " + name + " rollback first transaction");
      first_tx.reset();
    }

    // destroyed before `turn`: T2 is finished before the peer gets its go
    auto second_tx = store_->BeginTransaction(cancel);
    try {
      out.second_count = store_->TryAdvance(*second_tx, key, expected_version);
    } catch (const util::ConcurrentUpdateError& e) {
      RethrowWithCounts(e, out.first_count);
    }
    OPTIMIST_LOG_DEBUG("second attempt", {StringField("writer", name), UintField("affected", out.second_count)});

    core::EnsureConsistent(out.first_count, out.second_count, "writer " + name + " on " + id);

    try {
      store_->Commit(*second_tx, cancel, "writer " + name);
    } catch (const util::ConcurrentUpdateError& e) {
      // nothing of the second attempt survived the failed commit
      out.second_count = 0;
      RethrowWithCounts(e, out.first_count);
    }
    out.committed = true;
    out.status    = WriterStatus::kOk;
  } catch (const util::ConcurrentUpdateError& e) {
    out.status  = WriterStatus::kConflict;
    out.message = e.what();
    out.error   = std::current_exception();
  } catch (const std::exception& e) {
    out.status  = WriterStatus::kFailed;
    out.message = e.what();
    out.error   = std::current_exception();
  }

  if (!arrived && out.status != WriterStatus::kOk) {
    gate.Abandon();
  }

  if (out.status == WriterStatus::kFailed) {
    OPTIMIST_LOG_WARN("writer failed", {StringField("writer", name), StringField("error", out.message)});
  } else {
    OPTIMIST_LOG_INFO("writer finished", {StringField("writer", name), StringField("status", ToString(out.status)), UintField("first", out.first_count),
                                          UintField("second", out.second_count)});
  }
  return out;
}

} // namespace optimist::race
