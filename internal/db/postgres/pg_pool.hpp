#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace redrive::db::postgres {

/*
  PgPool

  Connection pool used by PgRepository.

  - Each transaction checks out its own connection.
  - libpqxx connections are not thread-safe, so one is never shared.
  - Acquire() blocks once max_connections are checked out.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction holds shared_ptr<pqxx::connection>; dropping it returns
    the connection to the pool (or closes it if the pool is gone).
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections = 16, int statement_timeout_ms = 0);

  std::shared_ptr<pqxx::connection> Acquire();

  const std::string& ConnInfo() const {
    return conninfo_;
  }

 private:
  std::unique_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;
  int         statement_timeout_ms_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace redrive::db::postgres
