#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

#include "coord/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace coord::runtime::config {
class CoordinationConfig;
}
namespace coord::events {
class EventLog;
}
namespace coord::agents {
class AgentRegistry;
}
namespace coord::lock {
class LockManager;
}
namespace coord::liveness {
class LivenessSweeper;
}
namespace coord::messaging {
class MessageBus;
}

namespace coord::core {

struct CoordinatorOptions {
  std::chrono::milliseconds lease_ttl{std::chrono::minutes(10)};
  std::chrono::milliseconds staleness_ttl{std::chrono::minutes(3)};
  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(60)};
  std::chrono::milliseconds message_ttl{std::chrono::hours(24)};

  uint32_t default_inbox_limit = 20;
  uint32_t max_inbox_limit     = 500;
  uint32_t default_log_limit   = 50;
  uint32_t max_log_limit       = 1000;

  // Unset or zero config values keep the defaults above.
  static CoordinatorOptions FromConfig(const coord::runtime::config::CoordinationConfig& config);
};

/*
  One project's coordination state machine.

  Every call opens one store transaction, re-reads what it needs, applies
  the change with its events and commits. Nothing is cached between calls,
  so several Coordinators (threads or processes) may share one store.

  Errors are thrown as coord::util exceptions; project_id on requests is
  ignored here (resolution happens before a Coordinator is chosen).
*/
class Coordinator {
 public:
  Coordinator(std::shared_ptr<db::Repository> repository, CoordinatorOptions options,
              std::shared_ptr<util::TimeSource> time_source = util::SystemTime());
  ~Coordinator();

  coord::v1::RegisterResponse  Register(const coord::v1::RegisterRequest& req);
  coord::v1::HeartbeatResponse Heartbeat(const coord::v1::HeartbeatRequest& req);

  // Conflict: lock_denied is committed, then util::LockConflict is thrown.
  coord::v1::LockResponse   Lock(const coord::v1::LockRequest& req);
  coord::v1::UnlockResponse Unlock(const coord::v1::UnlockRequest& req);

  coord::v1::StatusResponse Status(const coord::v1::StatusRequest& req);
  coord::v1::LogResponse    Log(const coord::v1::LogRequest& req);

  coord::v1::SendResponse  Send(const coord::v1::SendRequest& req);
  coord::v1::InboxResponse Inbox(const coord::v1::InboxRequest& req);
  coord::v1::AckResponse   Ack(const coord::v1::AckRequest& req);

  const CoordinatorOptions& Options() const {
    return options_;
  }

 private:
  uint64_t NowMs() const;

  std::shared_ptr<db::Repository>             repository_;
  CoordinatorOptions                          options_;
  std::shared_ptr<util::TimeSource>           time_source_;
  std::shared_ptr<events::EventLog>           events_;
  std::shared_ptr<agents::AgentRegistry>      registry_;
  std::shared_ptr<lock::LockManager>          locks_;
  std::shared_ptr<liveness::LivenessSweeper>  sweeper_;
  std::shared_ptr<messaging::MessageBus>      messages_;
};

} // namespace coord::core
