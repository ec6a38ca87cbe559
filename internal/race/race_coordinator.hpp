#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

#include "internal/core/record_store.hpp"
#include "internal/race/rendezvous.hpp"

namespace optimist::race {

// What happens to the first transaction while a writer waits at the gate.
enum class HoldMode {
  // T1 stays open across the delay and the gate, rolled back on the turn
  kHoldFirstTransaction = 0,
  // T1 is rolled back right after the first attempt
  kReleaseFirstTransaction,
};

const char* ToString(HoldMode mode);

struct RaceOptions {
  std::chrono::milliseconds hold_delay{1000};
  HoldMode                  hold_mode = HoldMode::kHoldFirstTransaction;
};

enum class WriterStatus {
  kOk = 0,    // counts matched, T2 committed
  kConflict,  // util::ConcurrentUpdateError
  kFailed,    // any other error
};

const char* ToString(WriterStatus status);

struct WriterOutcome {
  std::string   name;
  WriterStatus  status       = WriterStatus::kFailed;
  std::uint64_t first_count  = 0;
  std::uint64_t second_count = 0;
  bool          committed    = false;
  std::string   message;
  // set for kConflict and kFailed
  std::exception_ptr error;
};

struct RaceReport {
  std::array<WriterOutcome, 2> writers;

  bool        ConflictObserved() const;
  std::size_t Count(WriterStatus status) const;

  // version steps committed by the writers of this race
  std::uint64_t CommittedAdvances() const;

  // rethrows the error of the first kFailed writer, if any
  void RethrowFirstError() const;
};

/*
  RaceCoordinator

  Forces two writers, "a" and "b", through the same protocol on the same
  (key, expected_version), each on its own thread with its own
  transactions:

    T1 = begin; first = TryAdvance; [rollback T1 in release mode]
    gate.Arrive(); sleep hold_delay; turn = gate.AwaitTurn()
    [rollback T1 in hold mode]
    T2 = begin; second = TryAdvance
    commit T2 if first == second, otherwise ConcurrentUpdateError

  The turn is held until T2 is finished, so the second attempts never
  overlap. A writer failing before Arrive() abandons the gate; no error
  cancels the peer and both outcomes end up in the report.
*/
class RaceCoordinator {
 public:
  RaceCoordinator(std::shared_ptr<core::RecordStore> store, RaceOptions options = {});

  RaceReport Race(const util::UUID& key, std::uint64_t expected_version, const util::Cancellation& cancel);

  const RaceOptions& Options() const {
    return options_;
  }

 private:
  WriterOutcome RunWriter(const std::string& name, RendezvousGate& gate, const util::UUID& key, std::uint64_t expected_version,
                          const util::Cancellation& cancel) const;

  std::shared_ptr<core::RecordStore> store_;
  RaceOptions                        options_;
};

} // namespace optimist::race
