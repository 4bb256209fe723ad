#include "schema_initializer.hpp"

#include <exception>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identifier.hpp"

namespace connstate::core {

namespace {

void ValidateRelationName(const std::string& name) {
  if (!util::IsValidIdentifier(name)) {
    throw util::SchemaError("invalid relation name '" + name + "': only alphanumeric characters and underscores are allowed");
  }
}

} // namespace

SchemaInitializer::SchemaInitializer(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw util::ValidationError("schema initializer requires a repository");
  }
}

void SchemaInitializer::EnsureSchema() {
  const auto& tables = repository_->Tables();
  ValidateRelationName(tables.status_table);
  ValidateRelationName(tables.history_table);
  if (tables.status_table == tables.history_table) {
    throw util::SchemaError("status and history relations must have distinct names");
  }

  db::Result result;
  try {
    result = repository_->CreateSchema();
  } catch (const std::exception& e) {
    result = db::Result::Err(db::ErrorCode::InternalError, e.what());
  }

  if (!result) {
    CONNSTATE_LOG_ERROR("schema creation failed", {observability::StringField("code", db::ErrorCodeName(result.code)),
                                                   observability::StringField("error", result.message)});
    throw util::SchemaError("create connection relations: " + result.message);
  }

  CONNSTATE_LOG_INFO("connection schema ready", {observability::StringField("status_table", tables.status_table),
                                                 observability::StringField("history_table", tables.history_table)});
}

} // namespace connstate::core
