#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace redrive::db::sqlite {

namespace {

// BUSY/LOCKED after the busy timeout means another process holds the write
// lock; RunTransaction treats that like any other lost race.
[[noreturn]] void ThrowFor(int rc, const std::string& what) {
  const int primary = rc & 0xFF;
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    throw util::TransactionConflict(what);
  }
  throw util::StoreUnavailable(what);
}

} // namespace

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = "sqlite open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "failed");
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable(msg);
  }

  try {
    Configure(busy_timeout_ms);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite exec: " + std::string(err ? err : sqlite3_errstr(rc));
    sqlite3_free(err);
    ThrowFor(rc, msg);
  }
}

void SqliteDB::Configure(int busy_timeout_ms) {
  // Must precede the WAL switch, which itself needs the lock.
  const int rc = sqlite3_busy_timeout(db_, busy_timeout_ms);
  if (rc != SQLITE_OK) {
    ThrowFor(rc, std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }

  // Worker processes read while one of them holds the write lock.
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace redrive::db::sqlite
