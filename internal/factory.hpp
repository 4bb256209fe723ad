#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/schema_initializer.hpp"
#include "internal/core/state_store.hpp"
#include "internal/db/api/repository.hpp"

namespace connstate::factory {

/*
  RuntimeDependencies

  Owns the long-lived objects of the process. Everything here lives for
  the lifetime of the process; there is no global instance.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<core::SchemaInitializer> schema;
  std::shared_ptr<core::StateStore>        state_store;
};

/*
  BuildRuntime

  Selects the backend from config, runs EnsureSchema(), then constructs
  the StateStore. Throws util::SchemaError / util::ValidationError on a
  bad schema or relation name and std::runtime_error on a backend that
  was not compiled in.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(const connstate::runtime::config::RuntimeConfig& config);

// Relation names from config, with defaults for unset fields.
db::TableNames ResolveTableNames(const connstate::runtime::config::RuntimeConfig& config);

} // namespace connstate::factory
