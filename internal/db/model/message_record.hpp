#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/message_status.hpp"

namespace coord::db::model {

/*
  Inbox message.

  payload/result are stored as JSON text for portability:
    sqlite -> text
    memory -> string

  Expired rows stay in the store for audit and are filtered on read.
*/

struct MessageRecord {
  std::string message_id;
  std::string to;
  std::string from;
  std::string intent;

  std::string payload_json = "{}";

  std::optional<std::string> reply_to;

  coord::model::MessageStatus status = coord::model::MessageStatus::kPending;

  std::optional<std::string> result_json;

  uint64_t created_at_ms = 0;
  uint64_t expires_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace coord::db::model
