#include "memory_repository.hpp"

#include <stdexcept>

#include "memory_tx.hpp"

namespace connstate::db::memory {

namespace {

MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MissingTable(const std::string& table) {
  return Result::Err(ErrorCode::InternalError, "no such table: " + table);
}

} // namespace

MemoryRepository::MemoryRepository(TableNames tables) : tables_(std::move(tables)) {
}

Result MemoryRepository::CreateSchema() {
  // An open writer would commit its pre-schema snapshot over this.
  std::scoped_lock lock(writer_mutex_, mutex_);
  committed_.schema_created = true;
  return Result::Ok();
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::optional<model::CurrentStatusRecord> MemoryRepository::GetCurrentStatus(Transaction& t) {
  const auto& s = TX(t).View();
  if (!s.schema_created) throw std::runtime_error("no such table: " + tables_.status_table);
  return s.status;
}

Result MemoryRepository::UpsertCurrentStatus(Transaction& t, const model::CurrentStatusRecord& r) {
  if (!TX(t).Writable()) return Result::Err(ErrorCode::InternalError, "write in read-only transaction");
  auto& s = TX(t).Mutable();
  if (!s.schema_created) return MissingTable(tables_.status_table);
  if (r.channel_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "channel_id must not be empty");
  s.status = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteCurrentStatus(Transaction& t) {
  if (!TX(t).Writable()) return Result::Err(ErrorCode::InternalError, "write in read-only transaction");
  auto& s = TX(t).Mutable();
  if (!s.schema_created) return MissingTable(tables_.status_table);
  s.status.reset();
  return Result::Ok();
}

Result MemoryRepository::AppendHistory(Transaction& t, model::HistoryRecord& r) {
  if (!TX(t).Writable()) return Result::Err(ErrorCode::InternalError, "write in read-only transaction");
  auto& s = TX(t).Mutable();
  if (!s.schema_created) return MissingTable(tables_.history_table);
  if (r.channel_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "channel_id must not be empty");
  r.id = s.next_history_id++;
  s.history.push_back(r);
  return Result::Ok();
}

std::vector<model::HistoryRecord> MemoryRepository::ListHistory(Transaction& t, const HistoryFilter& filter,
                                                                const Pagination& pagination) {
  const auto& s = TX(t).View();
  if (!s.schema_created) throw std::runtime_error("no such table: " + tables_.history_table);

  std::vector<model::HistoryRecord> out;
  std::size_t skipped = 0;
  for (const auto& record : s.history) {
    if (filter.channel_id.has_value() && record.channel_id != *filter.channel_id) continue;
    if (filter.action.has_value() && record.action != *filter.action) continue;
    if (skipped < pagination.offset) {
      ++skipped;
      continue;
    }
    if (out.size() >= pagination.limit) break;
    out.push_back(record);
  }
  return out;
}

} // namespace connstate::db::memory
