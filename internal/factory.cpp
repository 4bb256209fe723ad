#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if CONNSTATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CONNSTATE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace connstate::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const connstate::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  auto        tables   = ResolveTableNames(config);

  if (database.has_sqlite()) {
#if CONNSTATE_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.path = database.sqlite().path();
    if (options.path.empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    if (database.sqlite().busy_timeout_ms() != 0) {
      options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());
    }
    if (database.sqlite().has_wal_mode()) {
      options.wal_mode = database.sqlite().wal_mode();
    }

    CONNSTATE_LOG_INFO("using sqlite backend", {observability::StringField("path", options.path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(options), std::move(tables));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CONNSTATE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);

    CONNSTATE_LOG_INFO("using postgres backend", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool), std::move(tables));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CONNSTATE_LOG_WARN("using in-memory backend; connection state will not survive restart");
  return std::make_shared<db::memory::MemoryRepository>(std::move(tables));
}

} // namespace

db::TableNames ResolveTableNames(const connstate::runtime::config::RuntimeConfig& config) {
  db::TableNames tables;
  const auto&    configured = config.database().tables();
  if (!configured.status_table().empty()) tables.status_table = configured.status_table();
  if (!configured.history_table().empty()) tables.history_table = configured.history_table();
  return tables;
}

RuntimeDependencies BuildRuntime(const connstate::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;
  deps.repository = BuildRepository(config);

  // Schema first: the store is only usable once both relations exist.
  deps.schema = std::make_shared<core::SchemaInitializer>(deps.repository);
  deps.schema->EnsureSchema();

  deps.state_store = std::make_shared<core::StateStore>(deps.repository);
  return deps;
}

} // namespace connstate::factory
