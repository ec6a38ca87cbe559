#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace optimist::core {

/*
  Converts a failed repository result into the matching util exception.

    NotFound                          -> util::NotFound
    AlreadyExists, ConstraintViolation -> util::DuplicateKey
    SerializationFailure, Conflict    -> util::ConcurrentUpdateError
    Busy, Timeout                     -> util::Timeout
    ConnectionError                   -> util::ConnectionError
    Corruption                        -> util::InvalidState
    anything else                     -> util::StatementError

  Does nothing for an OK result.
*/
void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace optimist::core
