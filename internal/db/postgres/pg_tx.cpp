#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace connstate::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, const std::string& lock_sql)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
  if (!lock_sql.empty()) {
    tx_->exec(lock_sql);
  }
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      CONNSTATE_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  committed_ = true;
}

}
