#include "internal/race/scenario.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using optimist::db::IsolationLevel;
using optimist::db::memory::MemoryRepository;
using optimist::race::HoldMode;
using optimist::race::ScenarioOptions;
using optimist::race::ScenarioRunner;
using optimist::race::WriterStatus;
using optimist::util::Cancellation;

ScenarioOptions FastOptions(HoldMode mode, IsolationLevel isolation) {
  ScenarioOptions options;
  options.isolation  = isolation;
  options.hold_mode  = mode;
  options.hold_delay = 20ms;
  options.timeout    = 10s;
  return options;
}

void TestEndToEndRunPassesWithOneConflict() {
  for (auto mode : {HoldMode::kHoldFirstTransaction, HoldMode::kReleaseFirstTransaction}) {
    auto           repo = std::make_shared<MemoryRepository>();
    ScenarioRunner runner(repo);

    const auto report = runner.Run(FastOptions(mode, IsolationLevel::kReadCommitted));
    if (!report.passed) std::cerr << optimist::race::Describe(report);

    assert(report.passed);
    assert(report.violations.empty());
    assert(report.conflict_observed);
    assert(report.final_version == 3);
    assert(report.race.Count(WriterStatus::kConflict) == 1);
  }
}

void TestFixedKeyIsUsedAndRemoved() {
  auto           repo = std::make_shared<MemoryRepository>();
  ScenarioRunner runner(repo);

  auto options        = FastOptions(HoldMode::kHoldFirstTransaction, IsolationLevel::kSerializable);
  options.primary_key = optimist::util::FromString("6f1c2a9e-8a55-4c1e-9d57-3b0e1f2a4c6d");

  const auto report = runner.Run(options);
  assert(report.passed);
  assert(report.primary_key == *options.primary_key);

  optimist::core::RecordStore store(repo, IsolationLevel::kReadCommitted);
  bool                        gone = false;
  try {
    store.Read(*options.primary_key, Cancellation::After(1s));
  } catch (const optimist::util::NotFound&) {
    gone = true;
  }
  assert(gone);
}

void TestTakenKeyAbortsTheRun() {
  auto repo = std::make_shared<MemoryRepository>();
  auto key  = optimist::util::GenerateUUID();

  optimist::core::RecordStore store(repo, IsolationLevel::kReadCommitted);
  store.Create(key, Cancellation::After(1s));

  ScenarioRunner runner(repo);
  auto           options = FastOptions(HoldMode::kHoldFirstTransaction, IsolationLevel::kReadCommitted);
  options.primary_key    = key;

  const auto report = runner.Run(options);
  assert(!report.passed);
  assert(report.violations.size() == 1);
  assert(report.violations[0].find("aborted") == 0);

  // someone else's row is left alone
  assert(store.Read(key, Cancellation::After(1s)).version == 1);
}

void TestDescribeListsWritersAndVerdict() {
  auto           repo = std::make_shared<MemoryRepository>();
  ScenarioRunner runner(repo);

  const auto report = runner.Run(FastOptions(HoldMode::kReleaseFirstTransaction, IsolationLevel::kReadCommitted));
  const auto text   = optimist::race::Describe(report);

  assert(text.find("passed=true") != std::string::npos);
  assert(text.find("writer a") != std::string::npos);
  assert(text.find("writer b") != std::string::npos);
  assert(text.find("conflict") != std::string::npos);
}

} // namespace

int main() {
  TestEndToEndRunPassesWithOneConflict();
  TestFixedKeyIsUsedAndRemoved();
  TestTakenKeyAbortsTheRun();
  TestDescribeListsWritersAndVerdict();

  std::cout << "optimist_unit_scenario: pass\n";
  return 0;
}
