#pragma once

#include "coord/v1.hpp"
#include "service_context.hpp"

namespace coord::service {

/*
  Proto-level entry point for all nine coordination calls. Resolves the
  request's project, runs the call on that project's Coordinator and records
  a span, request metrics and a log line per call. Errors propagate as
  coord::util exceptions for the transport layer to translate.
*/
class CoordinationService {
public:
  explicit CoordinationService(ServiceContext ctx);

  coord::v1::RegisterResponse Register(const coord::v1::RegisterRequest& req);
  coord::v1::HeartbeatResponse Heartbeat(const coord::v1::HeartbeatRequest& req);
  coord::v1::LockResponse Lock(const coord::v1::LockRequest& req);
  coord::v1::UnlockResponse Unlock(const coord::v1::UnlockRequest& req);
  coord::v1::StatusResponse Status(const coord::v1::StatusRequest& req);
  coord::v1::LogResponse Log(const coord::v1::LogRequest& req);
  coord::v1::SendResponse Send(const coord::v1::SendRequest& req);
  coord::v1::InboxResponse Inbox(const coord::v1::InboxRequest& req);
  coord::v1::AckResponse Ack(const coord::v1::AckRequest& req);

private:
  ServiceContext ctx_;
};

}
