#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace redrive::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  try {
    conn_ = pool->Acquire();
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(std::string("postgres connect: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    REDRIVE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::transaction_rollback& e) {
    finished_ = true;
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::in_doubt_error& e) {
    finished_ = true;
    throw util::StoreUnavailable(std::string("postgres commit in doubt: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    finished_ = true;
    throw util::StoreUnavailable(e.what());
  }
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  finished_ = true;
}

}
