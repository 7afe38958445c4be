#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace redrive::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the process; transactions on it are
  serialized through TransactionMutex().
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace redrive::db::sqlite
