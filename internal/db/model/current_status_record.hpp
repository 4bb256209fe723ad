#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace connstate::db::model {

/*
  The singleton current-status row.

  IMPORTANT:
  - Stored under the fixed key id = 1; the storage layer rejects any other
    key, so at most one row can exist.
  - connected_at is set once per connection; last_updated on every write.
*/

struct CurrentStatusRecord {
  std::string                channel_id;
  std::optional<std::string> guild_id;
  util::TimePoint            connected_at{};
  util::TimePoint            last_updated{};
};

} // namespace connstate::db::model
