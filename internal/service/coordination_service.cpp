#include "coordination_service.hpp"

#include <chrono>
#include <optional>
#include <string>

#include "internal/core/project_space.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace coord::service {

using namespace coord::v1;

namespace {

template <typename Req>
std::optional<std::string> ProjectId(const Req& req) {
  if (req.has_project_id() && !req.project_id().empty()) return req.project_id();
  return std::nullopt;
}

// Rejections the caller can act on are warnings; everything else is an error.
bool IsCallerError(const std::exception& ex) {
  return dynamic_cast<const util::ProjectNotFound*>(&ex) || dynamic_cast<const util::RequiredFieldMissing*>(&ex) ||
         dynamic_cast<const util::InvalidArgument*>(&ex) || dynamic_cast<const util::LockConflict*>(&ex) ||
         dynamic_cast<const util::UnlockNotOwner*>(&ex) || dynamic_cast<const util::MessageNotFound*>(&ex) ||
         dynamic_cast<const util::MessageWrongRecipient*>(&ex);
}

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::optional<std::string>& project_id, Fn&& fn) {
  coord::observability::ScopedLogContext log_context(project_id.value_or(""), route);
  coord::observability::SpanScope        span(route);
  span.SetAttribute("coord.project_id", project_id.value_or(""));

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    coord::observability::Metrics::Instance().RecordRequest(route, true);
    coord::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    const bool caller_error = IsCallerError(ex);
    if (caller_error) {
      span.RecordRejection("rejected", ex.what());
    } else {
      span.RecordException(ex.what());
    }
    coord::observability::Log(caller_error ? spdlog::level::warn : spdlog::level::err, "call failed",
                              {coord::observability::StringField("error", ex.what())});
    coord::observability::Metrics::Instance().RecordRequest(route, false);
    coord::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

} // namespace

CoordinationService::CoordinationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterResponse CoordinationService::Register(const RegisterRequest& req) {
  const auto project = ProjectId(req);
  return ObserveRpc("CoordinationService.Register", project, [&] { return ctx_.projects->For(project)->Register(req); });
}

HeartbeatResponse CoordinationService::Heartbeat(const HeartbeatRequest& req) {
  const auto project = ProjectId(req);
  return ObserveRpc("CoordinationService.Heartbeat", project, [&] { return ctx_.projects->For(project)->Heartbeat(req); });
}

LockResponse CoordinationService::Lock(const LockRequest& req) {
  const auto project = ProjectId(req);
  return ObserveRpc("CoordinationService.Lock", project, [&] { return ctx_.projects->For(project)->Lock(req); });
}

UnlockResponse CoordinationService::Unlock(const UnlockRequest& req) {
  const auto project = ProjectId(req);
  return ObserveRpc("CoordinationService.Unlock", project, [&] { return ctx_.projects->For(project)->Unlock(req); });
}

StatusResponse CoordinationService::Status(const StatusRequest& req) {
  const auto project = ProjectId(req);
  return ObserveRpc("CoordinationService.Status", project, [&] { return ctx_.projects->For(project)->Status(req); });
}

LogResponse CoordinationService::Log(const LogRequest& req) {
  const auto project = ProjectId(req);
  return ObserveRpc("CoordinationService.Log", project, [&] { return ctx_.projects->For(project)->Log(req); });
}

SendResponse CoordinationService::Send(const SendRequest& req) {
  const auto project = ProjectId(req);
  return ObserveRpc("CoordinationService.Send", project, [&] { return ctx_.projects->For(project)->Send(req); });
}

InboxResponse CoordinationService::Inbox(const InboxRequest& req) {
  const auto project = ProjectId(req);
  return ObserveRpc("CoordinationService.Inbox", project, [&] { return ctx_.projects->For(project)->Inbox(req); });
}

AckResponse CoordinationService::Ack(const AckRequest& req) {
  const auto project = ProjectId(req);
  return ObserveRpc("CoordinationService.Ack", project, [&] { return ctx_.projects->For(project)->Ack(req); });
}

} // namespace coord::service
