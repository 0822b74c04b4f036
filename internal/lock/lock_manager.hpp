#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace coord::events {
class EventLog;
}

namespace coord::lock {

enum class LockOutcome {
  kGranted,
  kRefreshed,
  kDenied,
};

struct LockDecision {
  LockOutcome             outcome = LockOutcome::kDenied;
  db::model::LockRecord   lock;     // the granted lock, or the blocking one when denied
  uint64_t                remaining_ms = 0;
};

struct UnlockResult {
  bool                       released = false;
  // set only when a live lock was removed
  std::optional<std::string> was_held_by;
};

/*
  Per-resource exclusive leases.

    FREE --lock--> HELD --unlock / expiry--> FREE
                   HELD --lock by owner--> HELD (expires_at pushed out)

  Callers pass the transaction that holds the store's write lock, so the
  read-then-write in Acquire cannot interleave with another writer.
*/
class LockManager {
 public:
  LockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events, std::chrono::milliseconds lease_ttl);

  // A denial is recorded as lock_denied in the same transaction and reported
  // through the decision; it does not throw.
  LockDecision Acquire(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id, const std::string& resource,
                       const std::optional<std::string>& reason);

  // Missing or expired lock: released with no was_held_by. Another owner:
  // UnlockNotOwner.
  UnlockResult Release(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id, const std::string& resource);

  // Deletes every expired lease, logging lock_released/lease_expired for
  // each. Returns the released resources.
  std::vector<std::string> PurgeExpired(db::Transaction& tx, uint64_t now_ms);

  // Deletes every lease owned by owner_agent_id (stale cleanup).
  std::vector<std::string> ReleaseOwnedBy(db::Transaction& tx, uint64_t now_ms, const std::string& owner_agent_id,
                                          const std::optional<std::string>& released_by);

  // Live leases only, ordered by resource.
  std::vector<db::model::LockRecord> ListActive(db::Transaction& tx, uint64_t now_ms);

  std::chrono::milliseconds LeaseTtl() const {
    return lease_ttl_;
  }

 private:
  void RecordRelease(db::Transaction& tx, uint64_t now_ms, const db::model::LockRecord& lock, const char* reason,
                     const std::optional<std::string>& released_by);

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<events::EventLog> events_;
  std::chrono::milliseconds         lease_ttl_;
};

} // namespace coord::lock
