#include "internal/core/schema_initializer.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "hooked_repository.hpp"
#include "internal/core/state_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#if CONNSTATE_DB_SQLITE
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using connstate::core::SchemaInitializer;
using connstate::core::StateStore;
using connstate::db::ErrorCode;
using connstate::db::Result;
using connstate::db::TableNames;
using connstate::db::memory::MemoryRepository;
using connstate::testing::HookedRepository;
using connstate::util::SchemaError;
using connstate::util::ValidationError;

template <typename Fn>
bool ThrowsSchemaError(Fn&& fn) {
  try {
    fn();
  } catch (const SchemaError&) {
    return true;
  }
  return false;
}

void TestEnsureSchemaIsIdempotent() {
  auto repo = std::make_shared<MemoryRepository>();
  SchemaInitializer schema(repo);
  schema.EnsureSchema();
  schema.EnsureSchema();

  StateStore store(repo);
  store.Connect("chan-1");
  schema.EnsureSchema();
  assert(store.IsConnected());
}

void TestStoreIsUnusableBeforeSchema() {
  auto       repo = std::make_shared<MemoryRepository>();
  StateStore store(repo);

  bool threw = false;
  try {
    (void)store.GetCurrent();
  } catch (const connstate::util::TransactionError&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidRelationNamesAreRejected() {
  for (const auto& tables : {TableNames{"connection_status; DROP TABLE x", "connection_history"},
                             TableNames{"connection_status", "history-log"}, TableNames{"", "connection_history"},
                             TableNames{"same_name", "same_name"}}) {
    auto repo = std::make_shared<HookedRepository>(tables);
    bool created = false;
    repo->on_create_schema = [&created]() {
      created = true;
      return Result::Ok();
    };

    SchemaInitializer schema(repo);
    assert(ThrowsSchemaError([&] { schema.EnsureSchema(); }));
    assert(!created && "DDL must not run for an invalid relation name");
  }
}

void TestStoreRejectsInvalidRelationNames() {
  bool threw = false;
  try {
    StateStore store(std::make_shared<MemoryRepository>(TableNames{"status table", "connection_history"}));
  } catch (const ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestBackendFailureBecomesSchemaError() {
  auto repo              = std::make_shared<HookedRepository>();
  repo->on_create_schema = []() { return Result::Err(ErrorCode::IOError, "disk full"); };

  SchemaInitializer schema(repo);
  assert(ThrowsSchemaError([&] { schema.EnsureSchema(); }));
}

void TestNullRepositoryIsRejected() {
  bool threw = false;
  try {
    SchemaInitializer schema(nullptr);
  } catch (const ValidationError&) {
    threw = true;
  }
  assert(threw);
}

// A writer opened before the schema existed must not commit its stale
// snapshot over CreateSchema.
void TestSchemaCreationWaitsForOpenWriter() {
  using namespace std::chrono_literals;

  MemoryRepository repo;
  auto             writer = repo.Begin();

  Result      created;
  std::thread creator([&] { created = repo.CreateSchema(); });
  std::this_thread::sleep_for(20ms);
  writer->Commit();
  creator.join();
  assert(created);

  auto tx = repo.BeginRead();
  assert(!repo.GetCurrentStatus(*tx).has_value());
  tx->Commit();
}

#if CONNSTATE_DB_SQLITE
void TestSqliteSchemaWithCustomNames() {
  const auto db_path = std::filesystem::temp_directory_path() /
                       ("connstate_schema_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db");

  connstate::db::sqlite::SqliteOptions options;
  options.path = db_path.string();

  auto repo = std::make_shared<connstate::db::sqlite::SqliteRepository>(options, TableNames{"voice_status", "voice_history"});
  SchemaInitializer schema(repo);
  schema.EnsureSchema();
  schema.EnsureSchema();

  StateStore store(repo);
  store.Connect("chan-1", "guild-1");
  assert(store.GetCurrent()->channel_id == "chan-1");
  assert(store.History().size() == 1);

  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path.string() + "-wal");
  std::filesystem::remove(db_path.string() + "-shm");
}

void TestSqliteUnopenableStoreBecomesSchemaError() {
  connstate::db::sqlite::SqliteOptions options;
  options.path = "/nonexistent-connstate-dir/state.db";

  auto repo = std::make_shared<connstate::db::sqlite::SqliteRepository>(options, TableNames{});
  SchemaInitializer schema(repo);
  assert(ThrowsSchemaError([&] { schema.EnsureSchema(); }));
}
#endif

} // namespace

int main() {
  TestEnsureSchemaIsIdempotent();
  TestStoreIsUnusableBeforeSchema();
  TestInvalidRelationNamesAreRejected();
  TestStoreRejectsInvalidRelationNames();
  TestBackendFailureBecomesSchemaError();
  TestNullRepositoryIsRejected();
  TestSchemaCreationWaitsForOpenWriter();
#if CONNSTATE_DB_SQLITE
  TestSqliteSchemaWithCustomNames();
  TestSqliteUnopenableStoreBecomesSchemaError();
#endif

  std::cout << "connstate_unit_schema_initializer: pass\n";
  return 0;
}
