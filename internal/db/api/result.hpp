#pragma once

#include <cstdint>
#include <string>

namespace optimist::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  ConnectionError,
  StatementError,
  Timeout,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  // rows changed by the statement (INSERT/UPDATE/DELETE)
  uint64_t affected_rows = 0;

  static Result Ok(uint64_t affected = 0) {
    Result r;
    r.affected_rows = affected;
    return r;
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    Result r;
    r.code    = c;
    r.message = std::move(msg);
    return r;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace optimist::db
