#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "internal/db/model/history_record.hpp"

namespace connstate::db {

// Relation names. Spliced into SQL text, so they must pass
// util::IsValidIdentifier before any statement is built from them.
struct TableNames {
  std::string status_table  = "connection_status";
  std::string history_table = "connection_history";
};

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

// LIMIT/OFFSET bind value. Clamped so a huge count never wraps negative
// (SQLite reads -1 as "no limit", PostgreSQL rejects it).
inline std::int64_t SqlBound(std::size_t count) {
  constexpr auto kMax = static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max());
  return static_cast<std::int64_t>(count < kMax ? count : kMax);
}

struct HistoryFilter {
  std::optional<std::string>          channel_id;
  std::optional<model::HistoryAction> action;
};

} // namespace connstate::db
