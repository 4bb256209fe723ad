#include "history_record.hpp"

namespace connstate::db::model {

const char* HistoryActionName(HistoryAction action) {
  switch (action) {
    case HistoryAction::kConnect:
      return "CONNECT";
    case HistoryAction::kDisconnect:
      return "DISCONNECT";
    case HistoryAction::kError:
      return "ERROR";
  }
  return "ERROR";
}

std::optional<HistoryAction> ParseHistoryAction(std::string_view name) {
  if (name == "CONNECT") return HistoryAction::kConnect;
  if (name == "DISCONNECT") return HistoryAction::kDisconnect;
  if (name == "ERROR") return HistoryAction::kError;
  return std::nullopt;
}

} // namespace connstate::db::model
