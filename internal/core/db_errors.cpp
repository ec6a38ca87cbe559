#include "db_errors.hpp"

#include "internal/util/errors.hpp"

namespace optimist::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context + ": " + db::ToString(result.code) : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::DuplicateKey(message);
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::Conflict:
      throw util::ConcurrentUpdateError(message, 0, 0);
    case db::ErrorCode::Busy:
    case db::ErrorCode::Timeout:
      throw util::Timeout(message);
    case db::ErrorCode::ConnectionError:
      throw util::ConnectionError(message);
    case db::ErrorCode::Corruption:
      throw util::InvalidState(message);
    default:
      throw util::StatementError(message);
  }
}

} // namespace optimist::core
