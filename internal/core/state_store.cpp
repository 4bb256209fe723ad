#include "state_store.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identifier.hpp"

namespace connstate::core {

using db::model::CurrentStatusRecord;
using db::model::HistoryAction;
using db::model::HistoryRecord;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  throw util::TransactionError(message + " (" + db::ErrorCodeName(result.code) + ")");
}

ConnectionSnapshot ToSnapshot(const CurrentStatusRecord& record) {
  return ConnectionSnapshot{record.channel_id, record.guild_id, record.connected_at, record.last_updated};
}

HistoryRecord MakeEvent(const std::string& channel_id, const std::optional<std::string>& guild_id, HistoryAction action,
                        util::TimePoint timestamp, std::optional<std::string> error_message = std::nullopt) {
  HistoryRecord event;
  event.channel_id    = channel_id;
  event.guild_id      = guild_id;
  event.action        = action;
  event.timestamp     = timestamp;
  event.error_message = std::move(error_message);
  return event;
}

std::string GuildForLog(const std::optional<std::string>& guild_id) {
  return guild_id.value_or("-");
}

void RollbackQuietly(db::Transaction& tx, std::string_view operation) {
  if (tx.IsCommitted()) return;
  try {
    tx.Rollback();
  } catch (const std::exception& e) {
    CONNSTATE_LOG_ERROR("rollback failed", {StringField("operation", operation), StringField("error", e.what())});
  }
}

// Runs fn inside one transaction and commits. Any failure rolls back and
// leaves as util::TransactionError; the transaction (and its store handle)
// is released before this returns or throws.
template <typename Fn>
auto InTransaction(std::unique_ptr<db::Transaction> (db::Repository::*begin)(), db::Repository& repository,
                   std::string_view operation, Fn&& fn) {
  std::unique_ptr<db::Transaction> tx;
  try {
    tx = (repository.*begin)();
    auto result = fn(*tx);
    tx->Commit();
    return result;
  } catch (const util::TransactionError&) {
    if (tx) RollbackQuietly(*tx, operation);
    throw;
  } catch (const std::exception& e) {
    if (tx) RollbackQuietly(*tx, operation);
    throw util::TransactionError(std::string(operation) + ": " + e.what());
  }
}

} // namespace

StateStore::StateStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw util::ValidationError("state store requires a repository");
  }
  for (const auto* name : {&repository_->Tables().status_table, &repository_->Tables().history_table}) {
    if (!util::IsValidIdentifier(*name)) {
      throw util::ValidationError("invalid relation name '" + *name + "'");
    }
  }
}

void StateStore::Connect(const std::string& channel_id, const std::optional<std::string>& guild_id) {
  if (channel_id.empty()) {
    throw util::ValidationError("connect: channel_id must not be empty");
  }

  try {
    const auto superseded = InTransaction(&db::Repository::Begin, *repository_, "connect", [&](db::Transaction& tx) {
      // Stamped only once the write lock is held, so timestamps follow commit order.
      const auto now      = util::Now();
      auto       previous = repository_->GetCurrentStatus(tx);
      if (previous.has_value()) {
        auto retired = MakeEvent(previous->channel_id, previous->guild_id, HistoryAction::kDisconnect, now, kSupersededMessage);
        ThrowIfDbError(repository_->AppendHistory(tx, retired), "connect: log superseded connection");
      }

      ThrowIfDbError(repository_->UpsertCurrentStatus(tx, CurrentStatusRecord{channel_id, guild_id, now, now}),
                     "connect: write current status");

      auto connected = MakeEvent(channel_id, guild_id, HistoryAction::kConnect, now);
      ThrowIfDbError(repository_->AppendHistory(tx, connected), "connect: log connect event");
      return previous;
    });

    if (superseded.has_value()) {
      CONNSTATE_LOG_INFO("connection superseded", {StringField("previous_channel_id", superseded->channel_id),
                                                   StringField("channel_id", channel_id)});
    }
    CONNSTATE_LOG_INFO("connected", {StringField("channel_id", channel_id), StringField("guild_id", GuildForLog(guild_id))});
  } catch (const util::TransactionError& e) {
    CONNSTATE_LOG_ERROR("connect failed", {StringField("channel_id", channel_id), StringField("error", e.what())});
    RecordFailure(channel_id, guild_id, std::string("connect failed: ") + e.what());
    throw;
  }
}

std::optional<ConnectionSnapshot> StateStore::Disconnect() {
  // Whatever was read before a failure; names the channel in the ERROR row.
  std::optional<CurrentStatusRecord> observed;
  try {
    auto removed = InTransaction(&db::Repository::Begin, *repository_, "disconnect",
                                 [&](db::Transaction& tx) -> std::optional<ConnectionSnapshot> {
                                   const auto now = util::Now();
                                   observed       = repository_->GetCurrentStatus(tx);
                                   if (!observed.has_value()) {
                                     return std::nullopt;
                                   }

                                   ThrowIfDbError(repository_->DeleteCurrentStatus(tx), "disconnect: delete current status");

                                   auto event = MakeEvent(observed->channel_id, observed->guild_id, HistoryAction::kDisconnect, now);
                                   ThrowIfDbError(repository_->AppendHistory(tx, event), "disconnect: log disconnect event");
                                   return ToSnapshot(*observed);
                                 });

    if (removed.has_value()) {
      CONNSTATE_LOG_INFO("disconnected", {StringField("channel_id", removed->channel_id),
                                          StringField("guild_id", GuildForLog(removed->guild_id))});
    } else {
      CONNSTATE_LOG_DEBUG("disconnect requested with no active connection");
    }
    return removed;
  } catch (const util::TransactionError& e) {
    CONNSTATE_LOG_ERROR("disconnect failed", {StringField("error", e.what())});
    if (observed.has_value()) {
      RecordFailure(observed->channel_id, observed->guild_id, std::string("disconnect failed: ") + e.what());
    } else {
      RecordFailure(kUnknownChannel, std::nullopt, std::string("disconnect failed: ") + e.what());
    }
    throw;
  }
}

std::optional<ConnectionSnapshot> StateStore::GetCurrent() {
  try {
    return InTransaction(&db::Repository::BeginRead, *repository_, "read current status",
                         [&](db::Transaction& tx) -> std::optional<ConnectionSnapshot> {
                           auto current = repository_->GetCurrentStatus(tx);
                           if (!current.has_value()) return std::nullopt;
                           return ToSnapshot(*current);
                         });
  } catch (const util::TransactionError& e) {
    CONNSTATE_LOG_ERROR("read current status failed", {StringField("error", e.what())});
    throw;
  }
}

bool StateStore::IsConnected() {
  return GetCurrent().has_value();
}

std::vector<HistoryEvent> StateStore::History(const HistoryQuery& query) {
  try {
    return InTransaction(&db::Repository::BeginRead, *repository_, "read history",
                         [&](db::Transaction& tx) { return repository_->ListHistory(tx, query.filter, query.pagination); });
  } catch (const util::TransactionError& e) {
    CONNSTATE_LOG_ERROR("read history failed", {StringField("error", e.what())});
    throw;
  }
}

// Best-effort: runs after the primary transaction is gone and never throws
// for a storage failure. The ERROR row is stamped under its own write lock.
void StateStore::RecordFailure(const std::string& channel_id, const std::optional<std::string>& guild_id, const std::string& message) {
  try {
    auto tx    = repository_->Begin();
    auto event = MakeEvent(channel_id, guild_id, HistoryAction::kError, util::Now(), message);

    const auto result = repository_->AppendHistory(*tx, event);
    if (!result) {
      CONNSTATE_LOG_ERROR("failed to record error event", {StringField("channel_id", channel_id),
                                                           StringField("code", db::ErrorCodeName(result.code)),
                                                           StringField("error", result.message)});
      RollbackQuietly(*tx, "record error event");
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    CONNSTATE_LOG_ERROR("failed to record error event", {StringField("channel_id", channel_id), StringField("error", e.what())});
  }
}

} // namespace connstate::core
