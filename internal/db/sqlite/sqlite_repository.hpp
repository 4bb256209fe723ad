#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace connstate::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  SqliteRepository(SqliteOptions options, TableNames tables);

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
  SqliteOptions options_;
  TableNames tables_;

  std::string select_status_sql_;
  std::string upsert_status_sql_;
  std::string delete_status_sql_;
  std::string insert_history_sql_;

  std::shared_ptr<SqliteDB> Open() const;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
