#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/race/scenario.hpp"

namespace optimist::factory {

/*
  BuildRepository

  Composition root for the storage layer: the ONLY place that knows the
  concrete backend types. Creates the entity schema (idempotent) before
  the repository is returned.
*/
std::shared_ptr<db::Repository> BuildRepository(const optimist::runtime::config::RuntimeConfig& config);

db::IsolationLevel ToIsolationLevel(optimist::runtime::config::IsolationLevel level);
race::HoldMode     ToHoldMode(optimist::runtime::config::HoldMode mode);

// scenario section as runner options; expects a config that went through
// ConfigLoader::ApplyDefaults
race::ScenarioOptions BuildScenarioOptions(const optimist::runtime::config::RuntimeConfig& config);

} // namespace optimist::factory
