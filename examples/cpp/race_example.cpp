#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "optimist/v1.hpp"

int main() {
  namespace v1 = optimist::v1;

  auto repository = std::make_shared<optimist::db::memory::MemoryRepository>();
  auto store      = std::make_shared<v1::RecordStore>(repository, v1::IsolationLevel::kReadCommitted);
  auto cancel     = v1::Cancellation::After(std::chrono::seconds(10));

  // Seed a row at version 2, the state the race starts from.
  const auto key = optimist::util::GenerateUUID();
  store->Create(key, cancel);
  store->Advance(key, 1, cancel);

  for (auto mode : {v1::HoldMode::kHoldFirstTransaction, v1::HoldMode::kReleaseFirstTransaction}) {
    const auto version = store->Read(key, cancel).version;

    v1::RaceCoordinator coordinator(store, optimist::race::RaceOptions{.hold_delay = std::chrono::milliseconds(100), .hold_mode = mode});
    const auto          report = coordinator.Race(key, version, cancel);

    std::cout << optimist::race::ToString(mode) << ": version " << version << " -> " << store->Read(key, cancel).version << "\n";
    for (const auto& writer : report.writers) {
      std::cout << "  writer " << writer.name << " " << optimist::race::ToString(writer.status) << " (first=" << writer.first_count
                << ", second=" << writer.second_count << ")\n";
    }
  }

  store->Delete(key, cancel);
  return 0;
}
