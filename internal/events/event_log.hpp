#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>
#include "internal/db/api/repository.hpp"

namespace coord::events {

// Actions recorded in the log. The set is open; these are the ones the
// coordinator itself writes.
namespace action {
inline constexpr const char* kRegistered   = "registered";
inline constexpr const char* kHeartbeat    = "heartbeat";
inline constexpr const char* kLockAcquired = "lock_acquired";
inline constexpr const char* kLockDenied   = "lock_denied";
inline constexpr const char* kLockReleased = "lock_released";
inline constexpr const char* kMessageSent  = "message_sent";
inline constexpr const char* kMessageAcked = "message_acked";
} // namespace action

// lock_released reasons
namespace reason {
inline constexpr const char* kUnlock            = "unlock";
inline constexpr const char* kLeaseExpired      = "lease_expired";
inline constexpr const char* kStaleAgentCleanup = "stale_agent_cleanup";
} // namespace reason

struct EventPage {
  std::vector<db::model::EventRecord> events; // newest first
  uint64_t                            total_count = 0;
};

/*
  Append-only audit trail.

  Writers are the other components, inside their own transaction, so an
  event is durable exactly when the state change it describes is.
*/
class EventLog {
 public:
  explicit EventLog(std::shared_ptr<db::Repository> repository);

  db::model::EventRecord Append(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id, const std::string& action,
                                std::optional<std::string> resource = std::nullopt, std::optional<std::string> reason = std::nullopt,
                                const google::protobuf::Struct* detail = nullptr);

  EventPage Query(db::Transaction& tx, const db::EventQuery& query);

 private:
  std::shared_ptr<db::Repository> repository_;
};

std::string EncodeDetail(const google::protobuf::Struct& detail);
google::protobuf::Struct DecodeDetail(const std::string& json);

} // namespace coord::events
