#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace coord::db::model {

/*
  Append-only audit row. event_id is assigned by the store on append and is
  strictly increasing, so it doubles as the time order.
*/

struct EventRecord {
  uint64_t    event_id     = 0;
  uint64_t    timestamp_ms = 0;
  std::string agent_id;
  std::string action;

  std::optional<std::string> resource;
  std::optional<std::string> reason;

  // JSON object text, empty when there is no detail
  std::string detail_json;
};

} // namespace coord::db::model
