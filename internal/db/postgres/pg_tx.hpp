#pragma once

#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace connstate::db::postgres {

/*
  pqxx::work on a pooled connection.

  A non-empty lock_sql runs first inside the transaction; write
  transactions use it to take the status-table lock.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, const std::string& lock_sql);
  ~PgTransaction() override;

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
};

}
