#pragma once

namespace connstate::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed, and must not throw
  - Write transactions are serialized against each other; a write
    transaction that read "no current status" cannot race another
    writer into the singleton slot

  SQLite:   BEGIN IMMEDIATE (reads: BEGIN DEFERRED)
  Postgres: pqxx::work + LOCK TABLE on the status relation
  Memory:   snapshot copy-on-write under an exclusive writer lock
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has finished the transaction
  virtual bool IsCommitted() const = 0;
};

} // namespace connstate::db
