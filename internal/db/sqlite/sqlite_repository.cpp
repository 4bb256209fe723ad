#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace connstate::db::sqlite {

using connstate::db::ErrorCode;
using connstate::db::Result;

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StatementPtr Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        return StatementPtr(nullptr, &sqlite3_finalize);
    }
    return StatementPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s.has_value()) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

[[noreturn]] void ThrowSqlite(sqlite3* db, const std::string& what) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(SqliteOptions options, TableNames tables)
    : options_(std::move(options)), tables_(std::move(tables)) {
    const auto& status  = tables_.status_table;
    const auto& history = tables_.history_table;

    select_status_sql_ =
        "SELECT channel_id,guild_id,connected_at,last_updated FROM " + status + " WHERE id=1;";

    upsert_status_sql_ =
        "INSERT INTO " + status + "(id,channel_id,guild_id,connected_at,last_updated) VALUES(1,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET channel_id=excluded.channel_id, guild_id=excluded.guild_id, "
        "connected_at=excluded.connected_at, last_updated=excluded.last_updated;";

    delete_status_sql_ = "DELETE FROM " + status + " WHERE id=1;";

    insert_history_sql_ =
        "INSERT INTO " + history + "(channel_id,guild_id,action,timestamp,error_message) VALUES(?,?,?,?,?);";
}

std::shared_ptr<SqliteDB> SqliteRepository::Open() const {
    return std::make_shared<SqliteDB>(options_);
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(Open(), SqliteTransaction::Mode::kImmediate);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(Open(), SqliteTransaction::Mode::kDeferred);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Schema
// ------------------------------------------------------------------

Result SqliteRepository::CreateSchema() {
    const std::string status_ddl =
        "CREATE TABLE IF NOT EXISTS " + tables_.status_table + " ("
        "id INTEGER PRIMARY KEY CHECK (id = 1), "
        "channel_id TEXT NOT NULL CHECK (channel_id <> ''), "
        "guild_id TEXT, "
        "connected_at TEXT NOT NULL, "
        "last_updated TEXT NOT NULL);";

    const std::string history_ddl =
        "CREATE TABLE IF NOT EXISTS " + tables_.history_table + " ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "channel_id TEXT NOT NULL, "
        "guild_id TEXT, "
        "action TEXT NOT NULL CHECK (action IN ('CONNECT', 'DISCONNECT', 'ERROR')), "
        "timestamp TEXT NOT NULL, "
        "error_message TEXT);";

    try {
        auto db = Open();
        if (options_.wal_mode) db->EnableWal();

        SqliteTransaction tx(db, SqliteTransaction::Mode::kImmediate);
        db->Exec(status_ddl);
        db->Exec(history_ddl);
        tx.Commit();
    } catch (const std::exception& e) {
        return Result::Err(ErrorCode::InternalError, e.what());
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// Current status
// ------------------------------------------------------------------

std::optional<model::CurrentStatusRecord> SqliteRepository::GetCurrentStatus(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, select_status_sql_);
    if (!st) ThrowSqlite(db, "select current status");

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowSqlite(db, "select current status");

    model::CurrentStatusRecord r;
    r.channel_id   = ColText(st.get(), 0);
    r.guild_id     = ColOptionalText(st.get(), 1);
    r.connected_at = util::ParseIso8601(ColText(st.get(), 2));
    r.last_updated = util::ParseIso8601(ColText(st.get(), 3));
    return r;
}

Result SqliteRepository::UpsertCurrentStatus(Transaction& t, const model::CurrentStatusRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, upsert_status_sql_);
    if (!st) return Translate(db, sqlite3_errcode(db));

    BindText(st.get(), 1, r.channel_id);
    BindOptionalText(st.get(), 2, r.guild_id);
    BindText(st.get(), 3, util::FormatIso8601(r.connected_at));
    BindText(st.get(), 4, util::FormatIso8601(r.last_updated));

    return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteCurrentStatus(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, delete_status_sql_);
    if (!st) return Translate(db, sqlite3_errcode(db));

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendHistory(Transaction& t, model::HistoryRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, insert_history_sql_);
    if (!st) return Translate(db, sqlite3_errcode(db));

    BindText(st.get(), 1, r.channel_id);
    BindOptionalText(st.get(), 2, r.guild_id);
    BindText(st.get(), 3, model::HistoryActionName(r.action));
    BindText(st.get(), 4, util::FormatIso8601(r.timestamp));
    BindOptionalText(st.get(), 5, r.error_message);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::vector<model::HistoryRecord> SqliteRepository::ListHistory(Transaction& t, const HistoryFilter& filter,
                                                                const Pagination& pagination) {
    auto* db = TX(t).Handle();

    std::string sql =
        "SELECT id,channel_id,guild_id,action,timestamp,error_message FROM " + tables_.history_table;
    std::string where;
    if (filter.channel_id.has_value()) where += " channel_id=?";
    if (filter.action.has_value()) where += where.empty() ? " action=?" : " AND action=?";
    if (!where.empty()) sql += " WHERE" + where;
    sql += " ORDER BY id ASC LIMIT ? OFFSET ?;";

    auto st = Prepare(db, sql);
    if (!st) ThrowSqlite(db, "select history");

    int idx = 1;
    if (filter.channel_id.has_value()) BindText(st.get(), idx++, *filter.channel_id);
    if (filter.action.has_value()) BindText(st.get(), idx++, model::HistoryActionName(*filter.action));
    BindI64(st.get(), idx++, SqlBound(pagination.limit));
    BindI64(st.get(), idx++, SqlBound(pagination.offset));

    std::vector<model::HistoryRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::HistoryRecord r;
        r.id         = ColU64(st.get(), 0);
        r.channel_id = ColText(st.get(), 1);
        r.guild_id   = ColOptionalText(st.get(), 2);

        const auto action = model::ParseHistoryAction(ColText(st.get(), 3));
        if (!action.has_value()) {
            throw std::runtime_error("history row " + std::to_string(r.id) + " has unknown action");
        }
        r.action        = *action;
        r.timestamp     = util::ParseIso8601(ColText(st.get(), 4));
        r.error_message = ColOptionalText(st.get(), 5);
        out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) ThrowSqlite(db, "select history");
    return out;
}

} // namespace connstate::db::sqlite
