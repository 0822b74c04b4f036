#include "agent_registry.hpp"

#include <algorithm>

#include "internal/core/store_errors.hpp"
#include "internal/events/event_log.hpp"
#include "internal/observability/logging.hpp"

namespace coord::agents {

namespace {

google::protobuf::Struct CapabilitiesDetail(const std::vector<std::string>& capabilities) {
  google::protobuf::Struct detail;
  auto*                    list = (*detail.mutable_fields())["capabilities"].mutable_list_value();
  for (const auto& c : capabilities) {
    list->add_values()->set_string_value(c);
  }
  return detail;
}

// Capabilities form a set; keep first occurrence order.
std::vector<std::string> Dedupe(std::vector<std::string> in) {
  std::vector<std::string> out;
  out.reserve(in.size());
  for (auto& c : in) {
    if (c.empty() || std::find(out.begin(), out.end(), c) != out.end()) continue;
    out.push_back(std::move(c));
  }
  return out;
}

} // namespace

AgentRegistry::AgentRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events,
                             std::chrono::milliseconds staleness_ttl)
    : repository_(std::move(repository)), events_(std::move(events)), staleness_ttl_(staleness_ttl) {
}

db::model::AgentRecord AgentRegistry::Register(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id,
                                               std::vector<std::string> capabilities) {
  auto existing = repository_->GetAgent(tx, agent_id);

  db::model::AgentRecord record;
  record.agent_id          = agent_id;
  record.capabilities      = Dedupe(std::move(capabilities));
  record.status            = model::AgentStatus::kActive;
  record.registered_at_ms  = existing ? existing->registered_at_ms : now_ms;
  record.last_heartbeat_ms = existing ? std::max(existing->last_heartbeat_ms, now_ms) : now_ms;
  if (existing) record.current_task = existing->current_task;

  core::ThrowIfDbError(repository_->UpsertAgent(tx, record), "register agent");

  auto detail = CapabilitiesDetail(record.capabilities);
  events_->Append(tx, now_ms, agent_id, events::action::kRegistered, std::nullopt, std::nullopt, &detail);

  COORD_LOG_INFO("agent registered", {observability::StringField("agent_id", agent_id),
                                      observability::IntField("capabilities", static_cast<int64_t>(record.capabilities.size())),
                                      observability::BoolField("reregistered", existing.has_value())});
  return record;
}

db::model::AgentRecord AgentRegistry::Heartbeat(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id,
                                                const std::optional<std::string>& current_task, std::optional<model::AgentStatus> status) {
  auto existing = repository_->GetAgent(tx, agent_id);

  db::model::AgentRecord record;
  if (existing) {
    record = *existing;
  } else {
    record.agent_id         = agent_id;
    record.registered_at_ms = now_ms;
    COORD_LOG_INFO("heartbeat from unknown agent; registering", {observability::StringField("agent_id", agent_id)});
  }

  // never move last_heartbeat backwards (clock skew between processes)
  record.last_heartbeat_ms = std::max(record.last_heartbeat_ms, now_ms);
  if (status) record.status = *status;
  if (current_task) {
    if (current_task->empty()) {
      record.current_task.reset();
    } else {
      record.current_task = *current_task;
    }
  }

  core::ThrowIfDbError(repository_->UpsertAgent(tx, record), "heartbeat");

  google::protobuf::Struct detail;
  (*detail.mutable_fields())["status"].set_string_value(std::string(model::ToString(record.status)));
  if (record.current_task) (*detail.mutable_fields())["current_task"].set_string_value(*record.current_task);
  if (!existing) (*detail.mutable_fields())["auto_registered"].set_bool_value(true);
  events_->Append(tx, now_ms, agent_id, events::action::kHeartbeat, std::nullopt, std::nullopt, &detail);

  return record;
}

std::vector<db::model::AgentRecord> AgentRegistry::List(db::Transaction& tx) {
  return repository_->ListAgents(tx);
}

std::vector<std::string> AgentRegistry::StaleAgents(db::Transaction& tx, uint64_t now_ms) {
  std::vector<std::string> out;
  for (const auto& agent : repository_->ListAgents(tx)) {
    if (IsStale(agent, now_ms)) out.push_back(agent.agent_id);
  }
  return out;
}

bool AgentRegistry::IsStale(const db::model::AgentRecord& agent, uint64_t now_ms) const {
  if (now_ms <= agent.last_heartbeat_ms) return false;
  return now_ms - agent.last_heartbeat_ms > static_cast<uint64_t>(staleness_ttl_.count());
}

model::AgentStatus AgentRegistry::EffectiveStatus(const db::model::AgentRecord& agent, uint64_t now_ms) const {
  return IsStale(agent, now_ms) ? model::AgentStatus::kStale : agent.status;
}

} // namespace coord::agents
