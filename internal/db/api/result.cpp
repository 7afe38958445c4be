#include "internal/db/api/repository.hpp"
#include "internal/db/api/result.hpp"

namespace redrive::db {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

const char* ToString(RetentionTable table) {
  switch (table) {
    case RetentionTable::DeadLetterArchive:
      return "dead_letter_archive";
    case RetentionTable::ReplayLog:
      return "replay_log";
    case RetentionTable::ProcessedOutbox:
      return "outbox";
  }
  return "unknown";
}

} // namespace redrive::db
