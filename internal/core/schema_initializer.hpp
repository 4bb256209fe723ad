#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"

namespace connstate::core {

/*
  Creates the status and history relations if they are absent.

  EnsureSchema() is idempotent. It throws util::SchemaError when a
  configured relation name is not a plain identifier or when the backend
  refuses the DDL.
*/
class SchemaInitializer {
 public:
  explicit SchemaInitializer(std::shared_ptr<db::Repository> repository);

  void EnsureSchema();

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace connstate::core
