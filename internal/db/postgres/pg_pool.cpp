#include "pg_pool.hpp"

namespace optimist::db::postgres {

PgPool::PgPool(std::string conninfo, std::string schema, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      schema_(std::move(schema)),
      max_connections_(max_connections < 2 ? 2 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire(const util::Cancellation& cancel) {
  for (;;) {
    cancel.ThrowIfCancelled("postgres acquire connection");
    {
      std::unique_lock lock(mutex_);

      while (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (conn->is_open()) return Wrap(conn.release());
        --live_connections_;
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareSession(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      const auto ready = [this] { return !idle_.empty() || live_connections_ < max_connections_; };
      if (auto deadline = cancel.Deadline()) {
        cv_.wait_until(lock, cancel.Token(), *deadline, ready);
      } else {
        cv_.wait(lock, cancel.Token(), ready);
      }
    }
  }
}

void PgPool::PrepareSession(pqxx::connection& conn) const {
  {
    pqxx::nontransaction session(conn);
    session.exec("SET search_path TO " + session.quote_name(schema_));
    session.commit();
  }

  conn.prepare("insert_entity",
               "INSERT INTO entity(primary_key,version) VALUES($1::uuid,$2)");

  conn.prepare("get_entity",
               "SELECT primary_key::text, version FROM entity WHERE primary_key=$1::uuid");

  conn.prepare("advance_entity_version",
               "UPDATE entity SET version=version+1 WHERE primary_key=$1::uuid AND version=$2");

  conn.prepare("delete_entity", "DELETE FROM entity WHERE primary_key=$1::uuid");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace optimist::db::postgres
