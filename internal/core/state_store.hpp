#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/util/time.hpp"

namespace connstate::core {

// What Disconnect()/GetCurrent() report about the active connection.
struct ConnectionSnapshot {
  std::string                channel_id;
  std::optional<std::string> guild_id;
  util::TimePoint            connected_at{};
  util::TimePoint            last_updated{};
};

using HistoryEvent = db::model::HistoryRecord;

struct HistoryQuery {
  db::HistoryFilter filter;
  db::Pagination    pagination;
};

/*
  StateStore

  Tracks the single active connection and appends every transition to the
  history log.

  Concurrency:
  - Holds no in-memory state beyond the repository handle; safe to call
    from any number of threads.
  - Connect/Disconnect each run one write transaction, which the backend
    serializes (see db/api/transaction.hpp).

  Failure handling:
  - A failed Connect/Disconnect is rolled back, then an ERROR history row
    is written in a second, independent transaction. Failure of that
    second write is logged only; the caller always receives the error of
    the primary attempt.
  - Read failures (GetCurrent/IsConnected/History) propagate as
    util::TransactionError. Only "no row" means "not connected".
*/
class StateStore {
 public:
  // Placeholder channel for ERROR rows when the failure happened before
  // any status was read.
  static constexpr const char* kUnknownChannel = "UNKNOWN";
  static constexpr const char* kSupersededMessage = "superseded by new connection";

  // Throws util::ValidationError if the repository's relation names are
  // not plain identifiers.
  explicit StateStore(std::shared_ptr<db::Repository> repository);

  // Throws util::ValidationError on an empty channel_id (nothing is
  // written), util::TransactionError on storage failure.
  void Connect(const std::string& channel_id, const std::optional<std::string>& guild_id = std::nullopt);

  // Returns the removed connection, or nullopt when already disconnected
  // (a true no-op: no history row is written).
  std::optional<ConnectionSnapshot> Disconnect();

  std::optional<ConnectionSnapshot> GetCurrent();
  bool                              IsConnected();

  std::vector<HistoryEvent> History(const HistoryQuery& query = {});

 private:
  void RecordFailure(const std::string& channel_id, const std::optional<std::string>& guild_id, const std::string& message);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace connstate::core
