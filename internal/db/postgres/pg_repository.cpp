#include "pg_repository.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace connstate::db::postgres {

namespace {

// Timestamps cross the wire as unix microseconds so no session timezone
// or text format is involved.
constexpr const char* kToMicros   = "(EXTRACT(EPOCH FROM {}) * 1000000)::BIGINT";
constexpr const char* kFromMicros = "(TIMESTAMPTZ 'epoch' + ${}::BIGINT * INTERVAL '1 microsecond')";

std::string Format(const char* pattern, const std::string& arg) {
  std::string out(pattern);
  return out.replace(out.find("{}"), 2, arg);
}

std::optional<std::string> OptionalText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<std::string>();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, TableNames tables)
    : pool_(std::move(pool)), tables_(std::move(tables)) {
  const auto& status  = tables_.status_table;
  const auto& history = tables_.history_table;

  // Row locks cannot guard a row that does not exist yet, so writers
  // serialize on the table. Plain readers are not blocked.
  lock_status_sql_ = "LOCK TABLE " + status + " IN SHARE ROW EXCLUSIVE MODE;";

  select_status_sql_ = "SELECT channel_id, guild_id, " + Format(kToMicros, "connected_at") + ", " +
                       Format(kToMicros, "last_updated") + " FROM " + status + " WHERE id = 1;";

  upsert_status_sql_ = "INSERT INTO " + status + " (id, channel_id, guild_id, connected_at, last_updated) VALUES (1, $1, $2, " +
                       Format(kFromMicros, "3") + ", " + Format(kFromMicros, "4") +
                       ") ON CONFLICT (id) DO UPDATE SET channel_id = EXCLUDED.channel_id, guild_id = EXCLUDED.guild_id, "
                       "connected_at = EXCLUDED.connected_at, last_updated = EXCLUDED.last_updated;";

  delete_status_sql_ = "DELETE FROM " + status + " WHERE id = 1;";

  insert_history_sql_ = "INSERT INTO " + history + " (channel_id, guild_id, action, timestamp, error_message) VALUES ($1, $2, $3, " +
                        Format(kFromMicros, "4") + ", $5) RETURNING id;";
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, lock_status_sql_);
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_, std::string{});
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::CreateSchema() {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);

    tx.exec("CREATE TABLE IF NOT EXISTS " + tables_.status_table +
            " (id SMALLINT PRIMARY KEY CHECK (id = 1), channel_id TEXT NOT NULL CHECK (channel_id <> ''), guild_id TEXT, "
            "connected_at TIMESTAMPTZ NOT NULL, last_updated TIMESTAMPTZ NOT NULL);");
    tx.exec("CREATE TABLE IF NOT EXISTS " + tables_.history_table +
            " (id BIGSERIAL PRIMARY KEY, channel_id TEXT NOT NULL, guild_id TEXT, "
            "action TEXT NOT NULL CHECK (action IN ('CONNECT', 'DISCONNECT', 'ERROR')), "
            "timestamp TIMESTAMPTZ NOT NULL, error_message TEXT);");
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CurrentStatusRecord> PgRepository::GetCurrentStatus(Transaction& t) {
  auto res = TX(t).Work().exec(select_status_sql_);
  if (res.empty()) return std::nullopt;

  model::CurrentStatusRecord r;
  r.channel_id   = res[0][0].as<std::string>();
  r.guild_id     = OptionalText(res[0][1]);
  r.connected_at = util::FromUnixMicros(res[0][2].as<int64_t>());
  r.last_updated = util::FromUnixMicros(res[0][3].as<int64_t>());
  return r;
}

Result PgRepository::UpsertCurrentStatus(Transaction& t, const model::CurrentStatusRecord& r) {
  try {
    TX(t).Work().exec_params(upsert_status_sql_, r.channel_id, r.guild_id, util::ToUnixMicros(r.connected_at),
                             util::ToUnixMicros(r.last_updated));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteCurrentStatus(Transaction& t) {
  try {
    TX(t).Work().exec(delete_status_sql_);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AppendHistory(Transaction& t, model::HistoryRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(insert_history_sql_, r.channel_id, r.guild_id, std::string(model::HistoryActionName(r.action)),
                                        util::ToUnixMicros(r.timestamp), r.error_message);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::HistoryRecord> PgRepository::ListHistory(Transaction& t, const HistoryFilter& filter,
                                                            const Pagination& pagination) {
  // Unused filters collapse to "IS NULL" so one statement covers every combination.
  const std::string sql = "SELECT id, channel_id, guild_id, action, " + Format(kToMicros, "timestamp") + ", error_message FROM " +
                          tables_.history_table +
                          " WHERE ($1::TEXT IS NULL OR channel_id = $1) AND ($2::TEXT IS NULL OR action = $2)"
                          " ORDER BY id ASC LIMIT $3 OFFSET $4;";

  std::optional<std::string> action;
  if (filter.action.has_value()) action = model::HistoryActionName(*filter.action);

  auto res = TX(t).Work().exec_params(sql, filter.channel_id, action, SqlBound(pagination.limit),
                                      SqlBound(pagination.offset));

  std::vector<model::HistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::HistoryRecord r;
    r.id         = row[0].as<uint64_t>();
    r.channel_id = row[1].as<std::string>();
    r.guild_id   = OptionalText(row[2]);

    const auto parsed = model::ParseHistoryAction(row[3].as<std::string>());
    if (!parsed.has_value()) {
      throw std::runtime_error("history row " + std::to_string(r.id) + " has unknown action");
    }
    r.action        = *parsed;
    r.timestamp     = util::FromUnixMicros(row[4].as<int64_t>());
    r.error_message = OptionalText(row[5]);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace connstate::db::postgres
