#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace connstate::db::memory {

class MemoryTransaction;

/*
  In-process backend. Used by tests and by configs that select no
  persistent store; nothing survives the process.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(TableNames tables = {});

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
  friend class MemoryTransaction;

  struct State {
    bool schema_created = false;

    std::optional<model::CurrentStatusRecord> status;
    std::vector<model::HistoryRecord> history;
    uint64_t next_history_id = 1;
  };

  TableNames tables_;

  // guards committed_
  std::mutex mutex_;
  // held for the lifetime of every write transaction
  std::mutex writer_mutex_;
  State committed_;
};

}
