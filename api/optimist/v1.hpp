#pragma once

#include "config/config.pb.h"

#include "internal/core/conflict_detector.hpp"
#include "internal/core/record_store.hpp"
#include "internal/race/race_coordinator.hpp"
#include "internal/race/rendezvous.hpp"
#include "internal/race/scenario.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace optimist::v1 {
using ::optimist::runtime::config::RuntimeConfig;
using ::optimist::core::CheckConsistency;
using ::optimist::core::Consistency;
using ::optimist::core::RecordStore;
using ::optimist::db::IsolationLevel;
using ::optimist::race::HoldMode;
using ::optimist::race::RaceCoordinator;
using ::optimist::race::RaceReport;
using ::optimist::race::RendezvousGate;
using ::optimist::race::ScenarioOptions;
using ::optimist::race::ScenarioReport;
using ::optimist::race::ScenarioRunner;
using ::optimist::util::Cancellation;
using ::optimist::util::ConcurrentUpdateError;
}
