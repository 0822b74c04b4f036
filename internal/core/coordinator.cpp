#include "coordinator.hpp"

#include <algorithm>
#include <string>

#include "config/config.pb.h"
#include "internal/agents/agent_registry.hpp"
#include "internal/events/event_log.hpp"
#include "internal/liveness/liveness_sweeper.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/messaging/message_bus.hpp"
#include "internal/util/errors.hpp"

namespace coord::core {

using namespace coord::v1;

namespace {

void Require(const std::string& value, const char* field) {
  if (value.empty()) throw util::RequiredFieldMissing(field);
}

std::size_t ClampLimit(bool has_limit, uint32_t limit, uint32_t fallback, uint32_t max) {
  if (!has_limit || limit == 0) return fallback;
  return std::min(limit, max);
}

std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback, bool has) {
  return has ? util::DurationOr(d, fallback) : fallback;
}

coord::v1::Agent ToProto(const db::model::AgentRecord& record, model::AgentStatus effective) {
  coord::v1::Agent agent;
  agent.set_agent_id(record.agent_id);
  for (const auto& c : record.capabilities) agent.add_capabilities(c);
  agent.set_status(std::string(model::ToString(effective)));
  if (record.current_task) agent.set_current_task(*record.current_task);
  *agent.mutable_registered_at()  = util::MillisToProto(record.registered_at_ms);
  *agent.mutable_last_heartbeat() = util::MillisToProto(record.last_heartbeat_ms);
  return agent;
}

coord::v1::Lock ToProto(const db::model::LockRecord& record) {
  coord::v1::Lock lock;
  lock.set_resource(record.resource);
  lock.set_owner_agent_id(record.owner_agent_id);
  *lock.mutable_acquired_at() = util::MillisToProto(record.acquired_at_ms);
  *lock.mutable_expires_at()  = util::MillisToProto(record.expires_at_ms);
  if (record.reason) lock.set_reason(*record.reason);
  return lock;
}

coord::v1::Message ToProto(const db::model::MessageRecord& record) {
  coord::v1::Message message;
  message.set_message_id(record.message_id);
  message.set_to(record.to);
  message.set_from(record.from);
  message.set_intent(record.intent);
  *message.mutable_payload() = messaging::DecodePayload(record.payload_json);
  if (record.reply_to) message.set_reply_to(*record.reply_to);
  message.set_status(std::string(model::ToString(record.status)));
  if (record.result_json) *message.mutable_result() = messaging::DecodePayload(*record.result_json);
  *message.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *message.mutable_expires_at() = util::MillisToProto(record.expires_at_ms);
  return message;
}

coord::v1::Event ToProto(const db::model::EventRecord& record) {
  coord::v1::Event event;
  event.set_event_id(record.event_id);
  *event.mutable_timestamp() = util::MillisToProto(record.timestamp_ms);
  event.set_agent_id(record.agent_id);
  event.set_action(record.action);
  if (record.resource) event.set_resource(*record.resource);
  if (record.reason) event.set_reason(*record.reason);
  if (!record.detail_json.empty()) *event.mutable_detail() = events::DecodeDetail(record.detail_json);
  return event;
}

} // namespace

CoordinatorOptions CoordinatorOptions::FromConfig(const coord::runtime::config::CoordinationConfig& config) {
  CoordinatorOptions options;
  options.lease_ttl          = DurationOr(config.lease_ttl(), options.lease_ttl, config.has_lease_ttl());
  options.staleness_ttl      = DurationOr(config.staleness_ttl(), options.staleness_ttl, config.has_staleness_ttl());
  options.heartbeat_interval = DurationOr(config.heartbeat_interval(), options.heartbeat_interval, config.has_heartbeat_interval());
  options.message_ttl        = DurationOr(config.message_ttl(), options.message_ttl, config.has_message_ttl());

  if (config.default_inbox_limit() > 0) options.default_inbox_limit = config.default_inbox_limit();
  if (config.max_inbox_limit() > 0) options.max_inbox_limit = config.max_inbox_limit();
  if (config.default_log_limit() > 0) options.default_log_limit = config.default_log_limit();
  if (config.max_log_limit() > 0) options.max_log_limit = config.max_log_limit();

  options.default_inbox_limit = std::min(options.default_inbox_limit, options.max_inbox_limit);
  options.default_log_limit   = std::min(options.default_log_limit, options.max_log_limit);
  return options;
}

Coordinator::Coordinator(std::shared_ptr<db::Repository> repository, CoordinatorOptions options, std::shared_ptr<util::TimeSource> time_source)
    : repository_(std::move(repository)), options_(options), time_source_(std::move(time_source)) {
  events_   = std::make_shared<events::EventLog>(repository_);
  registry_ = std::make_shared<agents::AgentRegistry>(repository_, events_, options_.staleness_ttl);
  locks_    = std::make_shared<lock::LockManager>(repository_, events_, options_.lease_ttl);
  sweeper_  = std::make_shared<liveness::LivenessSweeper>(registry_, locks_);
  messages_ = std::make_shared<messaging::MessageBus>(repository_, events_, options_.message_ttl);
}

Coordinator::~Coordinator() = default;

uint64_t Coordinator::NowMs() const {
  return util::ToUnixMillis(time_source_->Now());
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

RegisterResponse Coordinator::Register(const RegisterRequest& req) {
  Require(req.agent_id(), "agent_id");

  const auto now = NowMs();
  auto       tx  = repository_->Begin();
  auto       agent =
      registry_->Register(*tx, now, req.agent_id(), std::vector<std::string>(req.capabilities().begin(), req.capabilities().end()));
  tx->Commit();

  RegisterResponse resp;
  resp.set_agent_id(agent.agent_id);
  *resp.mutable_registered_at() = util::MillisToProto(agent.registered_at_ms);
  for (const auto& c : agent.capabilities) resp.add_capabilities(c);
  return resp;
}

HeartbeatResponse Coordinator::Heartbeat(const HeartbeatRequest& req) {
  Require(req.agent_id(), "agent_id");

  std::optional<model::AgentStatus> status;
  if (req.has_status()) {
    status = model::ParseAgentStatus(req.status());
    if (!status) throw util::InvalidArgument("status must be one of active, busy, idle; got '" + req.status() + "'");
  }
  std::optional<std::string> current_task;
  if (req.has_current_task()) current_task = req.current_task();

  const auto now   = NowMs();
  auto       tx    = repository_->Begin();
  auto       agent = registry_->Heartbeat(*tx, now, req.agent_id(), current_task, status);
  auto       sweep = sweeper_->Sweep(*tx, now, req.agent_id());
  tx->Commit();

  HeartbeatResponse resp;
  resp.set_agent_id(agent.agent_id);
  *resp.mutable_last_heartbeat() = util::MillisToProto(agent.last_heartbeat_ms);
  for (const auto& r : sweep.released_locks) resp.add_released_locks(r);
  for (const auto& a : sweep.stale_agents) resp.add_stale_agents(a);
  return resp;
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

LockResponse Coordinator::Lock(const LockRequest& req) {
  Require(req.agent_id(), "agent_id");
  Require(req.resource(), "resource");

  std::optional<std::string> reason;
  if (req.has_reason() && !req.reason().empty()) reason = req.reason();

  const auto now = NowMs();
  auto       tx  = repository_->Begin();
  locks_->PurgeExpired(*tx, now);
  auto decision = locks_->Acquire(*tx, now, req.agent_id(), req.resource(), reason);
  tx->Commit();

  if (decision.outcome == lock::LockOutcome::kDenied) {
    util::LockHolder holder;
    holder.resource       = decision.lock.resource;
    holder.owner_agent_id = decision.lock.owner_agent_id;
    holder.acquired_at_ms = decision.lock.acquired_at_ms;
    holder.expires_at_ms  = decision.lock.expires_at_ms;
    holder.remaining_ms   = decision.remaining_ms;
    throw util::LockConflict("resource " + req.resource() + " is locked by " + holder.owner_agent_id + " until " +
                                 util::FormatMillis(holder.expires_at_ms) + " (" + std::to_string(holder.remaining_ms / 1000) + "s remaining)",
                             std::move(holder));
  }

  LockResponse resp;
  resp.set_granted(true);
  resp.set_resource(decision.lock.resource);
  resp.set_owner_agent_id(decision.lock.owner_agent_id);
  *resp.mutable_expires_at() = util::MillisToProto(decision.lock.expires_at_ms);
  *resp.mutable_held_since() = util::MillisToProto(decision.lock.acquired_at_ms);
  resp.set_refreshed(decision.outcome == lock::LockOutcome::kRefreshed);
  return resp;
}

UnlockResponse Coordinator::Unlock(const UnlockRequest& req) {
  Require(req.agent_id(), "agent_id");
  Require(req.resource(), "resource");

  const auto now = NowMs();
  auto       tx  = repository_->Begin();
  locks_->PurgeExpired(*tx, now);
  auto result = locks_->Release(*tx, now, req.agent_id(), req.resource());
  tx->Commit();

  UnlockResponse resp;
  resp.set_released(result.released);
  resp.set_resource(req.resource());
  if (result.was_held_by) resp.set_was_held_by(*result.was_held_by);
  return resp;
}

// ------------------------------------------------------------------
// Status / log
// ------------------------------------------------------------------

StatusResponse Coordinator::Status(const StatusRequest&) {
  const auto now   = NowMs();
  auto       tx    = repository_->Begin();
  auto       sweep = sweeper_->Sweep(*tx, now, std::nullopt);
  auto       agents = registry_->List(*tx);
  auto       locks  = locks_->ListActive(*tx, now);
  tx->Commit();

  StatusResponse resp;
  for (const auto& agent : agents) {
    *resp.add_agents() = ToProto(agent, registry_->EffectiveStatus(agent, now));
  }
  for (const auto& lock : locks) {
    *resp.add_locks() = ToProto(lock);
  }
  for (const auto& a : sweep.stale_agents) resp.add_stale_agents(a);
  resp.set_heartbeat_interval_ms(options_.heartbeat_interval.count());
  resp.set_staleness_ttl_ms(options_.staleness_ttl.count());
  resp.set_lease_ttl_ms(options_.lease_ttl.count());
  return resp;
}

LogResponse Coordinator::Log(const LogRequest& req) {
  db::EventQuery query;
  if (req.has_agent_id() && !req.agent_id().empty()) query.agent_id = req.agent_id();
  if (req.has_action() && !req.action().empty()) query.action = req.action();
  query.limit = ClampLimit(req.has_limit(), req.limit(), options_.default_log_limit, options_.max_log_limit);

  auto tx   = repository_->Begin(db::TxMode::kReadOnly);
  auto page = events_->Query(*tx, query);
  tx->Commit();

  LogResponse resp;
  for (const auto& event : page.events) {
    *resp.add_events() = ToProto(event);
  }
  resp.set_total_count(page.total_count);
  return resp;
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

SendResponse Coordinator::Send(const SendRequest& req) {
  Require(req.to(), "to");
  Require(req.from(), "from");
  Require(req.intent(), "intent");
  if (!req.has_payload()) throw util::RequiredFieldMissing("payload");

  messaging::SendRequest send;
  send.to      = req.to();
  send.from    = req.from();
  send.intent  = req.intent();
  send.payload = req.payload();
  if (req.has_reply_to() && !req.reply_to().empty()) send.reply_to = req.reply_to();
  if (req.has_ttl_ms()) send.ttl = std::chrono::milliseconds(req.ttl_ms());

  const auto now     = NowMs();
  auto       tx      = repository_->Begin();
  auto       message = messages_->Send(*tx, now, std::move(send));
  tx->Commit();

  SendResponse resp;
  resp.set_message_id(message.message_id);
  *resp.mutable_expires_at() = util::MillisToProto(message.expires_at_ms);
  return resp;
}

InboxResponse Coordinator::Inbox(const InboxRequest& req) {
  Require(req.agent_id(), "agent_id");

  auto status = model::MessageStatus::kPending;
  if (req.has_status() && !req.status().empty()) {
    auto parsed = model::ParseMessageStatus(req.status());
    if (!parsed) throw util::InvalidArgument("status must be one of pending, acked, completed; got '" + req.status() + "'");
    status = *parsed;
  }
  const auto limit = ClampLimit(req.has_limit(), req.limit(), options_.default_inbox_limit, options_.max_inbox_limit);

  const auto now      = NowMs();
  auto       tx       = repository_->Begin(db::TxMode::kReadOnly);
  auto       messages = messages_->Inbox(*tx, now, req.agent_id(), status, limit);
  tx->Commit();

  InboxResponse resp;
  for (const auto& message : messages) {
    *resp.add_messages() = ToProto(message);
  }
  return resp;
}

AckResponse Coordinator::Ack(const AckRequest& req) {
  Require(req.message_id(), "message_id");
  Require(req.agent_id(), "agent_id");

  const auto now     = NowMs();
  auto       tx      = repository_->Begin();
  auto       message = messages_->Ack(*tx, now, req.message_id(), req.agent_id(), req.has_result() ? &req.result() : nullptr);
  tx->Commit();

  AckResponse resp;
  resp.set_message_id(message.message_id);
  resp.set_status(std::string(model::ToString(message.status)));
  return resp;
}

} // namespace coord::core
