#include "lock_manager.hpp"

#include <algorithm>

#include "internal/core/store_errors.hpp"
#include "internal/events/event_log.hpp"
#include "internal/lock/lock.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace coord::lock {

using observability::IntField;
using observability::StringField;

LockManager::LockManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events, std::chrono::milliseconds lease_ttl)
    : repository_(std::move(repository)), events_(std::move(events)), lease_ttl_(lease_ttl) {
}

LockDecision LockManager::Acquire(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id, const std::string& resource,
                                  const std::optional<std::string>& reason) {
  const uint64_t expires_at_ms = now_ms + static_cast<uint64_t>(lease_ttl_.count());

  // re-read immediately before deciding
  auto existing = repository_->GetLock(tx, resource);
  if (existing && IsExpired(*existing, now_ms)) {
    core::ThrowIfDbError(repository_->DeleteLock(tx, resource), "purge expired lock");
    RecordRelease(tx, now_ms, *existing, events::reason::kLeaseExpired, std::nullopt);
    existing.reset();
  }

  LockDecision decision;

  if (existing && existing->owner_agent_id != agent_id) {
    decision.outcome      = LockOutcome::kDenied;
    decision.lock         = *existing;
    decision.remaining_ms = RemainingMs(*existing, now_ms);

    google::protobuf::Struct detail;
    (*detail.mutable_fields())["holder"].set_string_value(existing->owner_agent_id);
    (*detail.mutable_fields())["held_since_ms"].set_number_value(static_cast<double>(existing->acquired_at_ms));
    (*detail.mutable_fields())["remaining_ms"].set_number_value(static_cast<double>(decision.remaining_ms));
    events_->Append(tx, now_ms, agent_id, events::action::kLockDenied, resource, reason, &detail);

    observability::Metrics::Instance().RecordLockDecision("denied");
    COORD_LOG_WARN("lock denied", {StringField("resource", resource), StringField("agent_id", agent_id),
                                   StringField("holder", existing->owner_agent_id), IntField("remaining_ms", static_cast<int64_t>(decision.remaining_ms))});
    return decision;
  }

  if (existing) {
    // same owner: refresh, keep acquired_at. Two refreshes inside one
    // millisecond still move the expiry forward.
    existing->expires_at_ms = std::max(expires_at_ms, existing->expires_at_ms + 1);
    if (reason) existing->reason = reason;
    core::ThrowIfDbError(repository_->UpsertLock(tx, *existing), "refresh lock");

    decision.outcome      = LockOutcome::kRefreshed;
    decision.lock         = *existing;
    decision.remaining_ms = RemainingMs(*existing, now_ms);

    observability::Metrics::Instance().RecordLockDecision("refreshed");
    COORD_LOG_DEBUG("lock refreshed", {StringField("resource", resource), StringField("agent_id", agent_id)});
    return decision;
  }

  db::model::LockRecord record;
  record.resource       = resource;
  record.owner_agent_id = agent_id;
  record.acquired_at_ms = now_ms;
  record.expires_at_ms  = expires_at_ms;
  record.reason         = reason;
  core::ThrowIfDbError(repository_->UpsertLock(tx, record), "acquire lock");

  events_->Append(tx, now_ms, agent_id, events::action::kLockAcquired, resource, reason);

  decision.outcome      = LockOutcome::kGranted;
  decision.lock         = record;
  decision.remaining_ms = RemainingMs(record, now_ms);

  observability::Metrics::Instance().RecordLockDecision("granted");
  COORD_LOG_INFO("lock acquired", {StringField("resource", resource), StringField("agent_id", agent_id)});
  return decision;
}

UnlockResult LockManager::Release(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id, const std::string& resource) {
  UnlockResult result;
  result.released = true;

  // nothing held: the resource is free, which is what the caller asked for
  auto existing = repository_->GetLock(tx, resource);
  if (!existing) return result;

  if (IsExpired(*existing, now_ms)) {
    core::ThrowIfDbError(repository_->DeleteLock(tx, resource), "purge expired lock");
    RecordRelease(tx, now_ms, *existing, events::reason::kLeaseExpired, std::nullopt);
    return result;
  }

  if (existing->owner_agent_id != agent_id) {
    COORD_LOG_WARN("unlock rejected: not owner",
                   {StringField("resource", resource), StringField("agent_id", agent_id), StringField("owner", existing->owner_agent_id)});
    throw util::UnlockNotOwner("cannot release lock on " + resource + ": held by " + existing->owner_agent_id + ", not " + agent_id,
                               resource, existing->owner_agent_id);
  }

  core::ThrowIfDbError(repository_->DeleteLock(tx, resource), "release lock");
  RecordRelease(tx, now_ms, *existing, events::reason::kUnlock, std::nullopt);

  result.was_held_by = existing->owner_agent_id;
  return result;
}

std::vector<std::string> LockManager::PurgeExpired(db::Transaction& tx, uint64_t now_ms) {
  std::vector<std::string> released;
  for (const auto& lock : repository_->ListLocks(tx)) {
    if (!IsExpired(lock, now_ms)) continue;
    core::ThrowIfDbError(repository_->DeleteLock(tx, lock.resource), "purge expired lock");
    RecordRelease(tx, now_ms, lock, events::reason::kLeaseExpired, std::nullopt);
    released.push_back(lock.resource);
  }
  return released;
}

std::vector<std::string> LockManager::ReleaseOwnedBy(db::Transaction& tx, uint64_t now_ms, const std::string& owner_agent_id,
                                                     const std::optional<std::string>& released_by) {
  std::vector<std::string> released;
  for (const auto& lock : repository_->ListLocks(tx)) {
    if (lock.owner_agent_id != owner_agent_id) continue;
    core::ThrowIfDbError(repository_->DeleteLock(tx, lock.resource), "release stale lock");
    RecordRelease(tx, now_ms, lock, events::reason::kStaleAgentCleanup, released_by);
    released.push_back(lock.resource);
  }
  return released;
}

std::vector<db::model::LockRecord> LockManager::ListActive(db::Transaction& tx, uint64_t now_ms) {
  std::vector<db::model::LockRecord> out;
  for (auto& lock : repository_->ListLocks(tx)) {
    if (!IsExpired(lock, now_ms)) out.push_back(std::move(lock));
  }
  return out;
}

void LockManager::RecordRelease(db::Transaction& tx, uint64_t now_ms, const db::model::LockRecord& lock, const char* reason,
                                const std::optional<std::string>& released_by) {
  google::protobuf::Struct  detail;
  google::protobuf::Struct* detail_ptr = nullptr;
  if (released_by) {
    (*detail.mutable_fields())["released_by"].set_string_value(*released_by);
    detail_ptr = &detail;
  }

  // attributed to the owner, whoever triggered the release
  events_->Append(tx, now_ms, lock.owner_agent_id, events::action::kLockReleased, lock.resource, std::string(reason), detail_ptr);

  observability::Metrics::Instance().RecordLockReleased(reason);
  COORD_LOG_INFO("lock released",
                 {StringField("resource", lock.resource), StringField("owner", lock.owner_agent_id), StringField("reason", reason)});
}

} // namespace coord::lock
