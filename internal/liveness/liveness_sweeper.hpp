#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"

namespace coord::agents {
class AgentRegistry;
}
namespace coord::lock {
class LockManager;
}

namespace coord::liveness {

struct SweepReport {
  std::vector<std::string> stale_agents;   // ordered by id
  std::vector<std::string> released_locks; // stale cleanup first, then lease expiry
};

/*
  Runs inside heartbeat and status. Releases every lock held by a stale agent,
  then every expired lease. Agent rows are left alone so a late heartbeat
  revives them.

  A lock therefore outlives its owner's crash by at most
  max(lease_ttl, staleness_ttl), plus the gap until the next call.
*/
class LivenessSweeper {
 public:
  LivenessSweeper(std::shared_ptr<agents::AgentRegistry> registry, std::shared_ptr<lock::LockManager> locks);

  // triggered_by is recorded as released_by on stale cleanup events.
  SweepReport Sweep(db::Transaction& tx, uint64_t now_ms, const std::optional<std::string>& triggered_by);

 private:
  std::shared_ptr<agents::AgentRegistry> registry_;
  std::shared_ptr<lock::LockManager>     locks_;
};

} // namespace coord::liveness
