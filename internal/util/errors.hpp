#pragma once

#include <stdexcept>
#include <string>

namespace connstate::util {

/*
  Central error types.

  Callers of the state store only ever see these; backend error types
  (sqlite, pqxx) are translated before they cross the core boundary.
*/

// Malformed input: empty channel id, invalid relation name. Never retried.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Relation creation failed. Fatal to startup.
class SchemaError : public std::runtime_error {
 public:
  explicit SchemaError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Begin/read/write/commit failure during a state transition, raised after rollback.
class TransactionError : public std::runtime_error {
 public:
  explicit TransactionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace connstate::util
