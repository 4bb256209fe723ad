#include "memory_tx.hpp"

namespace connstate::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool writable) : repo_(repo), writable_(writable) {
  if (writable_) {
    writer_lock_ = std::unique_lock<std::mutex>(repo_.writer_mutex_);
  }
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (writable_) {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  finished_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  finished_ = true;
  if (writer_lock_.owns_lock()) writer_lock_.unlock();
}

} // namespace connstate::db::memory
