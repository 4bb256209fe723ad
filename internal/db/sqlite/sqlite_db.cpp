#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace connstate::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + options_.path + ": " + msg);
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (!db_) return;
  const int rc = sqlite3_close(db_);
  if (rc != SQLITE_OK) {
    CONNSTATE_LOG_ERROR("sqlite close failed", {observability::StringField("path", options_.path),
                                                observability::StringField("error", sqlite3_errstr(rc))});
  }
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::EnableWal() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately; must come first so the
  // PRAGMAs below also wait
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");

  // NORMAL is a good tradeoff under WAL; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  Exec("PRAGMA foreign_keys=ON;");
}

} // namespace connstate::db::sqlite
