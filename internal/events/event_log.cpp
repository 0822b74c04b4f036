#include "event_log.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/core/store_errors.hpp"
#include "internal/util/errors.hpp"

namespace coord::events {

std::string EncodeDetail(const google::protobuf::Struct& detail) {
  if (detail.fields().empty()) return {};

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(detail, &out);
  if (!status.ok()) throw util::InvalidArgument("event detail: " + std::string(status.message()));
  return out;
}

google::protobuf::Struct DecodeDetail(const std::string& json) {
  google::protobuf::Struct detail;
  if (json.empty()) return detail;

  auto status = google::protobuf::util::JsonStringToMessage(json, &detail);
  if (!status.ok()) throw util::StoreError("corrupt event detail: " + std::string(status.message()), false);
  return detail;
}

EventLog::EventLog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

db::model::EventRecord EventLog::Append(db::Transaction& tx, uint64_t now_ms, const std::string& agent_id, const std::string& action,
                                        std::optional<std::string> resource, std::optional<std::string> reason,
                                        const google::protobuf::Struct* detail) {
  db::model::EventRecord record;
  record.timestamp_ms = now_ms;
  record.agent_id     = agent_id;
  record.action       = action;
  record.resource     = std::move(resource);
  record.reason       = std::move(reason);
  if (detail) record.detail_json = EncodeDetail(*detail);

  core::ThrowIfDbError(repository_->AppendEvent(tx, record), "append event");
  return record;
}

EventPage EventLog::Query(db::Transaction& tx, const db::EventQuery& query) {
  EventPage page;
  page.events      = repository_->ListEvents(tx, query);
  page.total_count = repository_->CountEvents(tx, query);
  return page;
}

} // namespace coord::events
