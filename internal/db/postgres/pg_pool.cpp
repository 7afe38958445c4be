#include "pg_pool.hpp"

#include <string>

namespace redrive::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, int statement_timeout_ms)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      statement_timeout_ms_(statement_timeout_ms) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) {
      return Wrap(conn.release());
    }
    // dropped by the server; replace it below
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    return Wrap(Open().release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  if (statement_timeout_ms_ > 0) {
    pqxx::nontransaction setup(*conn);
    setup.exec("SET statement_timeout = " + std::to_string(statement_timeout_ms_));
  }
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace redrive::db::postgres
