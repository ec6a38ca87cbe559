#include "pg_repository.hpp"

#include "internal/util/errors.hpp"

namespace optimist::db::postgres {

namespace {

Result Usable(const PgTransaction& tx, const char* what) {
  if (tx.IsFinished()) return Result::Err(ErrorCode::StatementError, std::string(what) + ": transaction already finished");
  if (tx.Cancel().IsCancelled()) return Result::Err(ErrorCode::Timeout, std::string(what) + ": transaction cancelled");
  return Result::Ok();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, PgOptions options) : pool_(std::move(pool)), options_(options) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin(IsolationLevel isolation, const util::Cancellation& cancel) {
  cancel.ThrowIfCancelled("postgres begin");

  try {
    return std::make_unique<PgTransaction>(pool_, isolation, cancel, options_);
  } catch (const util::Timeout&) {
    throw;
  } catch (const std::exception& e) {
    auto result = PgTransaction::Translate("postgres begin", e);
    switch (result.code) {
      case ErrorCode::ConnectionError:
        throw util::ConnectionError(result.message);
      case ErrorCode::Timeout:
      case ErrorCode::Busy:
        throw util::Timeout(result.message);
      default:
        throw util::StatementError(result.message);
    }
  }
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto& tx = TX(t);
  if (auto check = Usable(tx, "insert entity"); !check) return check;

  try {
    auto res = tx.Work().exec_prepared("insert_entity", r.primary_key, r.version);
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return PgTransaction::Translate("insert entity", e);
  }
}

Result PgRepository::GetEntity(Transaction& t, const std::string& id, model::EntityRecord& out) {
  auto& tx = TX(t);
  if (auto check = Usable(tx, "get entity"); !check) return check;

  try {
    auto res = tx.Work().exec_prepared("get_entity", id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, "entity " + id + " not found");

    out.primary_key = res[0][0].c_str();
    out.version     = res[0][1].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return PgTransaction::Translate("get entity", e);
  }
}

Result PgRepository::AdvanceVersion(Transaction& t, const std::string& id, uint64_t expected_version) {
  auto& tx = TX(t);
  if (auto check = Usable(tx, "advance version"); !check) return check;

  try {
    auto res = tx.Work().exec_prepared("advance_entity_version", id, expected_version);
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return PgTransaction::Translate("advance version", e);
  }
}

Result PgRepository::DeleteEntity(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (auto check = Usable(tx, "delete entity"); !check) return check;

  try {
    auto res = tx.Work().exec_prepared("delete_entity", id);
    return Result::Ok(static_cast<uint64_t>(res.affected_rows()));
  } catch (const std::exception& e) {
    return PgTransaction::Translate("delete entity", e);
  }
}

}
