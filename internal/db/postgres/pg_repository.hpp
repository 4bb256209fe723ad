#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace connstate::db::postgres {

class PgRepository final : public db::Repository {
public:
  PgRepository(std::shared_ptr<PgPool> pool, TableNames tables);

  const TableNames& Tables() const override { return tables_; }

  Result CreateSchema() override;

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  std::optional<model::CurrentStatusRecord> GetCurrentStatus(Transaction&) override;
  Result UpsertCurrentStatus(Transaction&, const model::CurrentStatusRecord&) override;
  Result DeleteCurrentStatus(Transaction&) override;

  Result AppendHistory(Transaction&, model::HistoryRecord& record) override;
  std::vector<model::HistoryRecord> ListHistory(Transaction&, const HistoryFilter& filter,
                                                const Pagination& pagination) override;

private:
  std::shared_ptr<PgPool> pool_;
  TableNames tables_;

  std::string lock_status_sql_;
  std::string select_status_sql_;
  std::string upsert_status_sql_;
  std::string delete_status_sql_;
  std::string insert_history_sql_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
