#include "message_bus.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/core/store_errors.hpp"
#include "internal/events/event_log.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace coord::messaging {

using observability::StringField;

std::string EncodePayload(const google::protobuf::Struct& payload) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &out);
  if (!status.ok()) throw util::InvalidArgument("payload: " + std::string(status.message()));
  return out;
}

google::protobuf::Struct DecodePayload(const std::string& json) {
  google::protobuf::Struct payload;
  if (json.empty()) return payload;

  auto status = google::protobuf::util::JsonStringToMessage(json, &payload);
  if (!status.ok()) throw util::StoreError("corrupt message payload: " + std::string(status.message()), false);
  return payload;
}

MessageBus::MessageBus(std::shared_ptr<db::Repository> repository, std::shared_ptr<events::EventLog> events, std::chrono::milliseconds default_ttl)
    : repository_(std::move(repository)), events_(std::move(events)), default_ttl_(default_ttl) {
}

db::model::MessageRecord MessageBus::Send(db::Transaction& tx, uint64_t now_ms, SendRequest request) {
  if (request.ttl.count() < 0) throw util::InvalidArgument("ttl_ms must not be negative");
  if (request.reply_to && (!util::IsMessageId(*request.reply_to) || !repository_->GetMessage(tx, *request.reply_to))) {
    throw util::MessageNotFound(*request.reply_to);
  }

  const auto ttl = request.ttl.count() == 0 ? default_ttl_ : request.ttl;
  // expires_at must stay representable; checked before anything is written
  const uint64_t headroom = now_ms < util::kMaxTimestampMillis ? util::kMaxTimestampMillis - now_ms : 0;
  if (static_cast<uint64_t>(ttl.count()) > headroom) {
    throw util::InvalidArgument("ttl_ms too large: message would outlive " + util::FormatMillis(util::kMaxTimestampMillis));
  }

  db::model::MessageRecord record;
  record.message_id    = util::NewMessageId();
  record.to            = std::move(request.to);
  record.from          = std::move(request.from);
  record.intent        = std::move(request.intent);
  record.payload_json  = EncodePayload(request.payload);
  record.reply_to      = std::move(request.reply_to);
  record.status        = model::MessageStatus::kPending;
  record.created_at_ms = now_ms;
  record.expires_at_ms = now_ms + static_cast<uint64_t>(ttl.count());
  record.updated_at_ms = now_ms;

  core::ThrowIfDbError(repository_->InsertMessage(tx, record), "send message");

  google::protobuf::Struct detail;
  (*detail.mutable_fields())["message_id"].set_string_value(record.message_id);
  (*detail.mutable_fields())["to"].set_string_value(record.to);
  (*detail.mutable_fields())["intent"].set_string_value(record.intent);
  if (record.reply_to) (*detail.mutable_fields())["reply_to"].set_string_value(*record.reply_to);
  events_->Append(tx, now_ms, record.from, events::action::kMessageSent, std::nullopt, std::nullopt, &detail);

  COORD_LOG_INFO("message sent", {StringField("message_id", record.message_id), StringField("from", record.from), StringField("to", record.to),
                                  StringField("intent", record.intent)});
  observability::Metrics::Instance().RecordMessage("sent");
  return record;
}

std::vector<db::model::MessageRecord> MessageBus::Inbox(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id,
                                                        model::MessageStatus status, std::size_t limit) {
  db::MessageQuery query;
  query.to         = agent_id;
  query.status     = status;
  query.live_at_ms = now_ms;
  query.limit      = limit;
  return repository_->ListMessages(tx, query);
}

db::model::MessageRecord MessageBus::Ack(db::Transaction& tx, uint64_t now_ms, const std::string& message_id, const std::string& agent_id,
                                         const google::protobuf::Struct* result) {
  if (!util::IsMessageId(message_id)) throw util::MessageNotFound(message_id);
  auto record = repository_->GetMessage(tx, message_id);
  if (!record) throw util::MessageNotFound(message_id);

  if (record->to != agent_id) {
    COORD_LOG_WARN("ack rejected: wrong recipient",
                   {StringField("message_id", message_id), StringField("agent_id", agent_id), StringField("recipient", record->to)});
    throw util::MessageWrongRecipient("message " + message_id + " is addressed to " + record->to + ", not " + agent_id, message_id, record->to);
  }

  // duplicate retries after completion
  if (model::IsTerminal(record->status)) return *record;

  const auto target = result ? model::MessageStatus::kCompleted : model::MessageStatus::kAcked;
  if (!model::CanTransition(record->status, target)) {
    // acked without result again: nothing to advance
    return *record;
  }

  record->status        = target;
  record->updated_at_ms = now_ms;
  if (result) record->result_json = EncodePayload(*result);

  core::ThrowIfDbError(repository_->UpdateMessage(tx, *record), "ack message");

  google::protobuf::Struct detail;
  (*detail.mutable_fields())["message_id"].set_string_value(message_id);
  (*detail.mutable_fields())["status"].set_string_value(std::string(model::ToString(target)));
  events_->Append(tx, now_ms, agent_id, events::action::kMessageAcked, std::nullopt, std::nullopt, &detail);

  COORD_LOG_INFO("message acked", {StringField("message_id", message_id), StringField("agent_id", agent_id),
                                   StringField("status", model::ToString(target))});
  observability::Metrics::Instance().RecordMessage(model::ToString(target));
  return *record;
}

} // namespace coord::messaging
