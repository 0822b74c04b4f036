#include "liveness_sweeper.hpp"

#include "internal/agents/agent_registry.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace coord::liveness {

LivenessSweeper::LivenessSweeper(std::shared_ptr<agents::AgentRegistry> registry, std::shared_ptr<lock::LockManager> locks)
    : registry_(std::move(registry)), locks_(std::move(locks)) {
}

SweepReport LivenessSweeper::Sweep(db::Transaction& tx, uint64_t now_ms, const std::optional<std::string>& triggered_by) {
  SweepReport report;
  report.stale_agents = registry_->StaleAgents(tx, now_ms);

  std::uint64_t cleaned = 0;
  for (const auto& agent_id : report.stale_agents) {
    auto released = locks_->ReleaseOwnedBy(tx, now_ms, agent_id, triggered_by);
    if (!released.empty()) ++cleaned;
    report.released_locks.insert(report.released_locks.end(), released.begin(), released.end());
  }
  observability::Metrics::Instance().RecordStaleAgents(cleaned);

  auto expired = locks_->PurgeExpired(tx, now_ms);
  report.released_locks.insert(report.released_locks.end(), expired.begin(), expired.end());

  if (!report.released_locks.empty()) {
    COORD_LOG_INFO("liveness sweep released locks", {observability::IntField("stale_agents", static_cast<int64_t>(report.stale_agents.size())),
                                                     observability::IntField("released", static_cast<int64_t>(report.released_locks.size())),
                                                     observability::StringField("triggered_by", triggered_by.value_or(""))});
  }
  return report;
}

} // namespace coord::liveness
