#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/race/race_coordinator.hpp"

namespace optimist::race {

struct ScenarioOptions {
  db::IsolationLevel        isolation  = db::IsolationLevel::kReadCommitted;
  std::chrono::milliseconds hold_delay{1000};
  HoldMode                  hold_mode  = HoldMode::kHoldFirstTransaction;
  std::chrono::milliseconds timeout{60000};
  // random when unset
  std::optional<util::UUID> primary_key;
};

struct ScenarioReport {
  bool          passed            = false;
  bool          conflict_observed = false;
  std::uint64_t final_version     = 0;
  util::UUID    primary_key{};
  RaceReport    race;
  // one line per deviation from the expected flow
  std::vector<std::string> violations;
};

/*
  ScenarioRunner

  End-to-end run against one repository:

    create(key)                 version 1
    advance(1) = 1, read        version 2
    advance(1) = 0, read        still 2 (stale version is not reapplied)
    race on expected version 2  two writers, forced interleaving
    read                        2 + committed advances, never 4
    delete = 1, read            NotFound

  Deviations are collected in the report instead of thrown. Errors that
  stop the run (store failures, timeout) are recorded as a violation as
  well; the key is deleted on a best-effort basis afterwards.
*/
class ScenarioRunner {
 public:
  explicit ScenarioRunner(std::shared_ptr<db::Repository> repository);

  ScenarioReport Run(const ScenarioOptions& options);

 private:
  std::shared_ptr<db::Repository> repository_;
};

std::string Describe(const ScenarioReport& report);

} // namespace optimist::race
