#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace connstate::db::model {

enum class HistoryAction {
  kConnect,
  kDisconnect,
  kError,
};

// "CONNECT" / "DISCONNECT" / "ERROR"; the persisted spelling.
const char*                  HistoryActionName(HistoryAction action);
std::optional<HistoryAction> ParseHistoryAction(std::string_view name);

/*
  Append-only audit row. id is assigned by the store on append and is
  never reused; rows are never updated or deleted.
*/
struct HistoryRecord {
  uint64_t                   id = 0;
  std::string                channel_id;
  std::optional<std::string> guild_id;
  HistoryAction              action = HistoryAction::kConnect;
  util::TimePoint            timestamp{};
  std::optional<std::string> error_message;
};

} // namespace connstate::db::model
