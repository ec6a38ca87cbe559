#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/core/version_updater.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/entity.hpp"
#include "internal/util/cancellation.hpp"

namespace optimist::core {

/*
  RecordStore

  Versioned CRUD on the entity table. Every call runs in its own
  transaction at the isolation level chosen at construction:

  - Create, Advance and Delete commit on success
  - Read always rolls back, so it never leaves locks behind
  - any failure (including cancellation) rolls back and throws the
    util error matching the store result

  BeginTransaction + TryAdvance expose the updater for callers that need
  to keep the transaction open across other work.
*/
class RecordStore {
 public:
  RecordStore(std::shared_ptr<db::Repository> repository, db::IsolationLevel isolation);

  // version 1. util::DuplicateKey if the key exists.
  model::Entity Create(const util::UUID& key, const util::Cancellation& cancel);

  // util::NotFound if absent
  model::Entity Read(const util::UUID& key, const util::Cancellation& cancel);

  // One conditional update in its own committed transaction. Returns the
  // affected count (0 or 1).
  std::uint64_t Advance(const util::UUID& key, std::uint64_t expected_version, const util::Cancellation& cancel);

  // rows removed (0 or 1)
  std::uint64_t Delete(const util::UUID& key, const util::Cancellation& cancel);

  std::unique_ptr<db::Transaction> BeginTransaction(const util::Cancellation& cancel);

  std::uint64_t TryAdvance(db::Transaction& tx, const util::UUID& key, std::uint64_t expected_version) const {
    return updater_.TryAdvance(tx, key, expected_version);
  }

  // commits `tx`, throwing the util error for a failed commit
  void Commit(db::Transaction& tx, const util::Cancellation& cancel, const std::string& context);

  db::IsolationLevel Isolation() const {
    return isolation_;
  }

  const db::Repository& Backend() const {
    return *repository_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  db::IsolationLevel              isolation_;
  VersionUpdater                  updater_;
};

} // namespace optimist::core
