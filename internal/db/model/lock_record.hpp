#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace coord::db::model {

/*
  Exclusive lease on a resource. At most one row per resource; a row whose
  expires_at_ms has passed is treated as absent and purged on next access.
*/

struct LockRecord {
  std::string resource;
  std::string owner_agent_id;

  uint64_t acquired_at_ms = 0;
  uint64_t expires_at_ms  = 0;

  std::optional<std::string> reason;
};

} // namespace coord::db::model
