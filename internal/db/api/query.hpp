#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/message_status.hpp"

namespace coord::db {

// Event log filter. Results are newest-first; limit applies after filtering.
struct EventQuery {
  std::optional<std::string> agent_id;
  std::optional<std::string> action;
  std::size_t                limit = 50;
};

// Inbox filter. Results are oldest-first (created_at, then insertion order).
struct MessageQuery {
  std::string                                to;
  std::optional<coord::model::MessageStatus> status;

  // When set, rows with expires_at_ms <= this value are skipped.
  std::optional<uint64_t> live_at_ms;

  std::size_t limit = 20;
};

} // namespace coord::db
