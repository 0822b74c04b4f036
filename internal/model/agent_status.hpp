#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace coord::model {

// Stored status is what the agent last reported. kStale is never stored; it
// is computed at read time from last_heartbeat and the staleness TTL.
enum class AgentStatus : std::uint8_t {
  kActive = 1,
  kBusy   = 2,
  kIdle   = 3,
  kStale  = 4,
};

constexpr std::string_view ToString(AgentStatus status) {
  switch (status) {
    case AgentStatus::kBusy:
      return "busy";
    case AgentStatus::kIdle:
      return "idle";
    case AgentStatus::kStale:
      return "stale";
    case AgentStatus::kActive:
    default:
      return "active";
  }
}

// Only caller-reportable values parse; "stale" is rejected.
constexpr std::optional<AgentStatus> ParseAgentStatus(std::string_view value) {
  if (value == "active") return AgentStatus::kActive;
  if (value == "busy") return AgentStatus::kBusy;
  if (value == "idle") return AgentStatus::kIdle;
  return std::nullopt;
}

} // namespace coord::model
