#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/agent_status.hpp"

namespace coord::db::model {

/*
  Persistent agent row.

  - agent_id is unique within a project.
  - last_heartbeat_ms never moves backwards for a given agent.
  - Rows are never deleted; staleness is computed on read.
*/

struct AgentRecord {
  std::string              agent_id;
  std::vector<std::string> capabilities;

  coord::model::AgentStatus status = coord::model::AgentStatus::kActive;

  std::optional<std::string> current_task;

  uint64_t registered_at_ms  = 0;
  uint64_t last_heartbeat_ms = 0;
};

} // namespace coord::db::model
