#pragma once

#include <cstdint>
#include <string>

namespace redrive::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.

  Conditional writes (compare-and-set) report the number of rows they
  touched in `affected`; zero rows is a normal outcome, not an error.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;
  uint64_t    affected = 0;

  static Result Ok(uint64_t affected = 0) {
    return {ErrorCode::OK, {}, affected};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg), 0};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ToString(ErrorCode code);

} // namespace redrive::db
