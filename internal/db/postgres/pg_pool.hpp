#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/util/cancellation.hpp"

namespace optimist::db::postgres {

/*
  PgPool

  Connection factory used by PgRepository.

  Design notes:
  -------------
  - Each transaction gets its own connection; the race needs two writers
    holding open transactions at the same time, so max_connections >= 2.
  - libpqxx connections are NOT thread-safe -> do not share.
  - Prepared statements and search_path are installed per connection.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>; releasing it
    returns the connection to the idle list
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::string schema, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection. Waits for a free slot until the
  // cancellation fires (util::Timeout). Connect failures propagate as
  // pqxx::broken_connection.
  std::shared_ptr<pqxx::connection> Acquire(const util::Cancellation& cancel);

  const std::string& Schema() const {
    return schema_;
  }

 private:
  void                              PrepareSession(pqxx::connection& conn) const;
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::string schema_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable_any                    cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace optimist::db::postgres
