#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>
#include "internal/db/api/repository.hpp"
#include "internal/model/message_status.hpp"

namespace coord::events {
class EventLog;
}

namespace coord::messaging {

struct SendRequest {
  std::string                to;
  std::string                from;
  std::string                intent;
  google::protobuf::Struct   payload;
  std::optional<std::string> reply_to;
  std::chrono::milliseconds  ttl{0}; // zero: bus default
};

/*
  Persistent pull-based inbox.

    pending --ack--> acked --ack(result)--> completed
    pending --ack(result)--> completed

  Delivery is at-least-once: a message stays readable until its recipient
  moves it out of the queried status or it expires. Expired messages are kept
  for audit and filtered on read.
*/
class MessageBus {
 public:
  MessageBus(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events, std::chrono::milliseconds default_ttl);

  db::model::MessageRecord Send(db::Transaction& tx, uint64_t now_ms, SendRequest request);

  // Oldest first. Expired messages are skipped.
  std::vector<db::model::MessageRecord> Inbox(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id, model::MessageStatus status,
                                              std::size_t limit);

  // Only the recipient may ack. Acking a completed message is a no-op that
  // returns the stored record.
  db::model::MessageRecord Ack(db::Transaction& tx, uint64_t now_ms, const std::string& message_id, const std::string& agent_id,
                               const google::protobuf::Struct* result);

 private:
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<events::EventLog> events_;
  std::chrono::milliseconds         default_ttl_;
};

std::string EncodePayload(const google::protobuf::Struct& payload);
google::protobuf::Struct DecodePayload(const std::string& json);

} // namespace coord::messaging
