#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace connstate::db::sqlite {

/*
  SQLite transaction wrapper. Owns its connection.

  Write transactions use BEGIN IMMEDIATE:
    - grabs the write lock before the first read
    - two writers can never both observe an empty status table
  Read transactions use BEGIN DEFERRED.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kImmediate, kDeferred };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
