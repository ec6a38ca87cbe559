#include "scenario.hpp"

#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace optimist::race {

using observability::BoolField;
using observability::StringField;
using observability::UintField;

namespace {

class Checker {
 public:
  explicit Checker(ScenarioReport& report) : report_(report) {
  }

  void Expect(bool ok, const std::string& what) {
    if (ok) {
      OPTIMIST_LOG_DEBUG("scenario step ok", {StringField("step", what)});
      return;
    }
    OPTIMIST_LOG_WARN("scenario step failed", {StringField("step", what)});
    report_.violations.push_back(what);
  }

 private:
  ScenarioReport& report_;
};

} // namespace

ScenarioRunner::ScenarioRunner(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

ScenarioReport ScenarioRunner::Run(const ScenarioOptions& options) {
  ScenarioReport report;
  report.primary_key = options.primary_key.value_or(util::GenerateUUID());

  const auto key    = report.primary_key;
  const auto cancel = util::Cancellation::After(options.timeout);
  auto       store  = std::make_shared<core::RecordStore>(repository_, options.isolation);
  Checker    check(report);

  OPTIMIST_LOG_INFO("scenario started", {StringField("backend", repository_->BackendName()), StringField("key", util::ToString(key)),
                                         StringField("isolation", db::ToString(options.isolation)), StringField("hold_mode", ToString(options.hold_mode)),
                                         UintField("hold_delay_ms", static_cast<std::uint64_t>(options.hold_delay.count()))});

  bool created = false;
  try {
    auto entity = store->Create(key, cancel);
    created     = true;
    check.Expect(entity.version == 1, "create starts at version 1");
    check.Expect(store->Read(key, cancel).version == 1, "read after create returns version 1");

    check.Expect(store->Advance(key, 1, cancel) == 1, "advance with current version changes one row");
    check.Expect(store->Read(key, cancel).version == 2, "read after advance returns version 2");

    check.Expect(store->Advance(key, 1, cancel) == 0, "advance with stale version changes no row");
    check.Expect(store->Read(key, cancel).version == 2, "stale advance leaves version 2");

    RaceCoordinator coordinator(store, RaceOptions{.hold_delay = options.hold_delay, .hold_mode = options.hold_mode});
    report.race              = coordinator.Race(key, 2, cancel);
    report.conflict_observed = report.race.ConflictObserved();

    for (const auto& writer : report.race.writers) {
      check.Expect(writer.status != WriterStatus::kFailed, "writer " + writer.name + " did not fail: " + writer.message);
    }
    const auto advances = report.race.CommittedAdvances();
    check.Expect(advances <= 1, "race advanced the version at most once");
    check.Expect(report.conflict_observed || report.race.Count(WriterStatus::kOk) == 2, "race ended in a conflict or two clean writers");

    report.final_version = store->Read(key, cancel).version;
    check.Expect(report.final_version == 2 + advances, "final version matches committed advances");

    check.Expect(store->Delete(key, cancel) == 1, "delete removes the row");
    created = false;

    try {
      store->Read(key, cancel);
      check.Expect(false, "read after delete fails with NotFound");
    } catch (const util::NotFound&) {
      check.Expect(true, "read after delete fails with NotFound");
    }
  } catch (const std::exception& e) {
    OPTIMIST_LOG_ERROR("scenario aborted", {StringField("error", e.what())});
    report.violations.push_back(std::string("aborted: ") + e.what());
  }

  if (created) {
    try {
      store->Delete(key, util::Cancellation::After(options.timeout));
    } catch (const std::exception& e) {
      OPTIMIST_LOG_WARN("scenario cleanup failed", {StringField("key", util::ToString(key)), StringField("error", e.what())});
    }
  }

  report.passed = report.violations.empty();
  OPTIMIST_LOG_INFO("scenario finished", {BoolField("passed", report.passed), BoolField("conflict_observed", report.conflict_observed),
                                          UintField("final_version", report.final_version)});
  return report;
}

std::string Describe(const ScenarioReport& report) {
  std::ostringstream out;
  out << "key=" << util::ToString(report.primary_key) << " passed=" << (report.passed ? "true" : "false")
      << " conflict_observed=" << (report.conflict_observed ? "true" : "false") << " final_version=" << report.final_version << "\n";
  for (const auto& writer : report.race.writers) {
    if (writer.name.empty()) continue;
    out << "  writer " << writer.name << ": " << ToString(writer.status) << " first=" << writer.first_count << " second=" << writer.second_count;
    if (!writer.message.empty()) out << " (" << writer.message << ")";
    out << "\n";
  }
  for (const auto& violation : report.violations) {
    out << "  violation: " << violation << "\n";
  }
  return out.str();
}

} // namespace optimist::race
