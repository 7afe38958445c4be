#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace redrive::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), guard_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      REDRIVE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  const int rc = sqlite3_exec(db_->Handle(), "COMMIT;", nullptr, nullptr, nullptr);
  if ((rc & 0xFF) == SQLITE_BUSY) {
    throw util::TransactionConflict(std::string("sqlite commit busy: ") + sqlite3_errmsg(db_->Handle()));
  }
  if (rc != SQLITE_OK) {
    throw util::StoreUnavailable(std::string("sqlite commit failed: ") + sqlite3_errmsg(db_->Handle()));
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace redrive::db::sqlite
