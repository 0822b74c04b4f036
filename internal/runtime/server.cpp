#include "server.hpp"

#include <stdexcept>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace coord::runtime {

using observability::IntField;
using observability::StringField;

ServerOptions ServerOptions::FromConfig(const coord::runtime::config::ServerConfig& config) {
  ServerOptions options;
  options.bind_address = config.bind_address();
  options.shutdown_grace = util::DurationOr(config.shutdown_grace(), options.shutdown_grace);
  return options;
}

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

int Server::Start() {
  if (options_.bind_address.empty()) {
    throw std::runtime_error("server.bind_address is empty");
  }

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &port_);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + options_.bind_address);
  }

  COORD_LOG_INFO("coordinator listening", {StringField("bind_address", options_.bind_address), IntField("port", port_),
                                           IntField("services", static_cast<int64_t>(services_.size()))});
  return port_;
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;

  COORD_LOG_INFO("coordinator draining", {IntField("grace_ms", options_.shutdown_grace.count())});
  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();
}

} // namespace coord::runtime
