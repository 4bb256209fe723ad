#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace connstate::db::sqlite {

struct SqliteOptions {
  std::string path;
  int         busy_timeout_ms = 5000;
  bool        wal_mode        = true;
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  The repository opens one per transaction, so a connection is never
  shared between threads or reused after a failed operation.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/DDL/transaction control)
  void Exec(const std::string& sql);

  // Switch the database file to WAL. Persistent, so only the schema
  // bootstrap connection needs to do it.
  void EnableWal();

 private:
  // Per-connection PRAGMAs (busy timeout, synchronous, foreign keys)
  void Configure();

  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
};

} // namespace connstate::db::sqlite
