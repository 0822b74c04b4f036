#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "coord/v1/coordination_service.grpc.pb.h"
#include "internal/service/coordination_service.hpp"

namespace coord::grpc {

class CoordinationServer final : public coord::v1::CoordinationService::Service {
public:
  explicit CoordinationServer(std::shared_ptr<coord::service::CoordinationService> svc);

  ::grpc::Status Register(::grpc::ServerContext*, const coord::v1::RegisterRequest*, coord::v1::RegisterResponse*) override;
  ::grpc::Status Heartbeat(::grpc::ServerContext*, const coord::v1::HeartbeatRequest*, coord::v1::HeartbeatResponse*) override;
  ::grpc::Status Lock(::grpc::ServerContext*, const coord::v1::LockRequest*, coord::v1::LockResponse*) override;
  ::grpc::Status Unlock(::grpc::ServerContext*, const coord::v1::UnlockRequest*, coord::v1::UnlockResponse*) override;
  ::grpc::Status Status(::grpc::ServerContext*, const coord::v1::StatusRequest*, coord::v1::StatusResponse*) override;
  ::grpc::Status Log(::grpc::ServerContext*, const coord::v1::LogRequest*, coord::v1::LogResponse*) override;
  ::grpc::Status Send(::grpc::ServerContext*, const coord::v1::SendRequest*, coord::v1::SendResponse*) override;
  ::grpc::Status Inbox(::grpc::ServerContext*, const coord::v1::InboxRequest*, coord::v1::InboxResponse*) override;
  ::grpc::Status Ack(::grpc::ServerContext*, const coord::v1::AckRequest*, coord::v1::AckResponse*) override;

private:
  std::shared_ptr<coord::service::CoordinationService> service_;
};

}
