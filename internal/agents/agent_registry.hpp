#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/agent_status.hpp"

namespace coord::events {
class EventLog;
}

namespace coord::agents {

/*
  Known agents and their liveness.

  An agent is stale once now - last_heartbeat exceeds the staleness TTL.
  Staleness is computed on read and never written back; a heartbeat or a
  re-register revives the agent.
*/
class AgentRegistry {
 public:
  AgentRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events, std::chrono::milliseconds staleness_ttl);

  // Idempotent. Re-registering replaces capabilities and resets status to
  // active; registered_at keeps its first value.
  db::model::AgentRecord Register(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id, std::vector<std::string> capabilities);

  // Unknown agents are created with no capabilities.
  db::model::AgentRecord Heartbeat(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id,
                                   const std::optional<std::string>& current_task, std::optional<model::AgentStatus> status);

  std::vector<db::model::AgentRecord> List(db::Transaction& tx);

  // Ids of stale agents, ordered by id.
  std::vector<std::string> StaleAgents(db::Transaction& tx, uint64_t now_ms);

  bool IsStale(const db::model::AgentRecord& agent, uint64_t now_ms) const;

  // kStale when stale, otherwise the stored status.
  model::AgentStatus EffectiveStatus(const db::model::AgentRecord& agent, uint64_t now_ms) const;

  std::chrono::milliseconds StalenessTtl() const {
    return staleness_ttl_;
  }

 private:
  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<events::EventLog> events_;
  std::chrono::milliseconds         staleness_ttl_;
};

} // namespace coord::agents
