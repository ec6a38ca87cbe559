#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace optimist::util {

/*
  Central error types.

  Repository results are translated into these by core::ThrowIfDbError.
  ConcurrentUpdateError is the expected outcome of a lost race and is kept
  apart from StorageError so callers can branch on "conflict" vs "failure".
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateKey : public std::runtime_error {
 public:
  explicit DuplicateKey(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConcurrentUpdateError : public std::runtime_error {
 public:
  ConcurrentUpdateError(const std::string& msg, std::uint64_t expected_rows, std::uint64_t actual_rows)
      : std::runtime_error(msg), expected_rows_(expected_rows), actual_rows_(actual_rows) {
  }

  // affected rows of the first attempt
  std::uint64_t ExpectedRows() const {
    return expected_rows_;
  }

  // affected rows of the second attempt
  std::uint64_t ActualRows() const {
    return actual_rows_;
  }

 private:
  std::uint64_t expected_rows_;
  std::uint64_t actual_rows_;
};

/*
  Infrastructure failures of the storage collaborator.
  Propagated unchanged, never retried by the core.
*/
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectionError : public StorageError {
 public:
  explicit ConnectionError(const std::string& msg) : StorageError(msg) {
  }
};

class StatementError : public StorageError {
 public:
  explicit StatementError(const std::string& msg) : StorageError(msg) {
  }
};

class Timeout : public StorageError {
 public:
  explicit Timeout(const std::string& msg) : StorageError(msg) {
  }
};

} // namespace optimist::util
