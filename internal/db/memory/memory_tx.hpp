#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace connstate::db::memory {

/*
  Transaction = snapshot + write set

  Write transactions hold the repository's writer lock from construction
  until Commit()/Rollback(), which serializes read-modify-write sequences.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool writable);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

  bool Writable() const {
    return writable_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_lock_;
  MemoryRepository::State      working_;
  bool                         writable_ = false;
  bool                         finished_ = false;
};

} // namespace connstate::db::memory
