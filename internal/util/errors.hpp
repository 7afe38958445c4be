#pragma once

#include <stdexcept>
#include <string>

namespace redrive::util {

/*
  Central error types.

  Components catch these at operation boundaries and turn them into
  empty results or summary error counts. Expected outcomes (lock held,
  record already claimed, replay already recorded) are never thrown.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backing store failed or returned an unexpected result code.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Commit lost an optimistic / serialization race; the transaction body may be re-run.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace redrive::util
