#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace coord::model {

enum class MessageStatus : std::uint8_t {
  kPending   = 1,
  kAcked     = 2,
  kCompleted = 3,
};

constexpr bool IsTerminal(MessageStatus status) {
  return status == MessageStatus::kCompleted;
}

// Forward-only: pending -> acked -> completed, or pending -> completed.
constexpr bool CanTransition(MessageStatus from, MessageStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

constexpr std::string_view ToString(MessageStatus status) {
  switch (status) {
    case MessageStatus::kAcked:
      return "acked";
    case MessageStatus::kCompleted:
      return "completed";
    case MessageStatus::kPending:
    default:
      return "pending";
  }
}

constexpr std::optional<MessageStatus> ParseMessageStatus(std::string_view value) {
  if (value == "pending") return MessageStatus::kPending;
  if (value == "acked") return MessageStatus::kAcked;
  if (value == "completed") return MessageStatus::kCompleted;
  return std::nullopt;
}

} // namespace coord::model
