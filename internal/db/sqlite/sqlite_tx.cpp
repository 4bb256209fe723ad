#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace connstate::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode) : db_(std::move(db)) {
  db_->Exec(mode == Mode::kImmediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  // sqlite may already have rolled back on its own (e.g. after an I/O error)
  if (!committed_ && !sqlite3_get_autocommit(db_->Handle())) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      CONNSTATE_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  if (!sqlite3_get_autocommit(db_->Handle())) db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace connstate::db::sqlite
