#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/current_status_record.hpp"
#include "internal/db/model/history_record.hpp"

namespace connstate::db {

/*
  Repository abstraction over the two connection relations.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Begin() transactions are serialized against each other (see
    transaction.hpp); the singleton invariant depends on this
  - Every transaction owns its own store handle, released when the
    transaction is destroyed

  Writes report failures through Result. Reads return their value and
  throw std::runtime_error on a backend failure; "no row" is never an
  error.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual const TableNames& Tables() const = 0;

  // ---------------------------------------------------------------------
  // Schema
  // ---------------------------------------------------------------------

  // CREATE ... IF NOT EXISTS for both relations. Idempotent.
  virtual Result CreateSchema() = 0;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Read-write, serialized against other Begin() transactions.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only snapshot; does not take the writer lock.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Current status (singleton)
  // ---------------------------------------------------------------------

  virtual std::optional<model::CurrentStatusRecord> GetCurrentStatus(Transaction&) = 0;

  // Insert or replace the singleton row.
  virtual Result UpsertCurrentStatus(Transaction&, const model::CurrentStatusRecord&) = 0;

  // Deleting an absent row is not an error.
  virtual Result DeleteCurrentStatus(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // History (append-only)
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result AppendHistory(Transaction&, model::HistoryRecord& record) = 0;

  // Ascending id order.
  virtual std::vector<model::HistoryRecord> ListHistory(Transaction&, const HistoryFilter& filter, const Pagination& pagination) = 0;
};

} // namespace connstate::db
