#include "coordination_server.hpp"
#include "grpc_error.hpp"

namespace coord::grpc {

namespace {

template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

CoordinationServer::CoordinationServer(std::shared_ptr<coord::service::CoordinationService> svc)
    : service_(std::move(svc)) {}

::grpc::Status CoordinationServer::Register(::grpc::ServerContext*, const coord::v1::RegisterRequest* req,
                                            coord::v1::RegisterResponse* resp) {
  return Invoke([&] { *resp = service_->Register(*req); });
}

::grpc::Status CoordinationServer::Heartbeat(::grpc::ServerContext*, const coord::v1::HeartbeatRequest* req,
                                             coord::v1::HeartbeatResponse* resp) {
  return Invoke([&] { *resp = service_->Heartbeat(*req); });
}

::grpc::Status CoordinationServer::Lock(::grpc::ServerContext*, const coord::v1::LockRequest* req, coord::v1::LockResponse* resp) {
  return Invoke([&] { *resp = service_->Lock(*req); });
}

::grpc::Status CoordinationServer::Unlock(::grpc::ServerContext*, const coord::v1::UnlockRequest* req, coord::v1::UnlockResponse* resp) {
  return Invoke([&] { *resp = service_->Unlock(*req); });
}

::grpc::Status CoordinationServer::Status(::grpc::ServerContext*, const coord::v1::StatusRequest* req, coord::v1::StatusResponse* resp) {
  return Invoke([&] { *resp = service_->Status(*req); });
}

::grpc::Status CoordinationServer::Log(::grpc::ServerContext*, const coord::v1::LogRequest* req, coord::v1::LogResponse* resp) {
  return Invoke([&] { *resp = service_->Log(*req); });
}

::grpc::Status CoordinationServer::Send(::grpc::ServerContext*, const coord::v1::SendRequest* req, coord::v1::SendResponse* resp) {
  return Invoke([&] { *resp = service_->Send(*req); });
}

::grpc::Status CoordinationServer::Inbox(::grpc::ServerContext*, const coord::v1::InboxRequest* req, coord::v1::InboxResponse* resp) {
  return Invoke([&] { *resp = service_->Inbox(*req); });
}

::grpc::Status CoordinationServer::Ack(::grpc::ServerContext*, const coord::v1::AckRequest* req, coord::v1::AckResponse* resp) {
  return Invoke([&] { *resp = service_->Ack(*req); });
}

}
