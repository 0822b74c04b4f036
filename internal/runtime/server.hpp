#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace coord::runtime::config {
class ServerConfig;
}

namespace coord::runtime {

struct ServerOptions {
  std::string               bind_address;
  std::chrono::milliseconds shutdown_grace{5000};

  static ServerOptions FromConfig(const coord::runtime::config::ServerConfig& config);
};

/*
  Owns the gRPC server for coordd. Services are registered in order; Stop()
  lets in-flight coordination calls finish within shutdown_grace and then
  cancels the rest. Safe to call Stop() more than once.
*/
class Server {
public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Returns the bound port (useful with ":0").
  int Start();
  void Wait();
  void Stop();

private:
  ServerOptions options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int port_ = 0;
};

} // namespace coord::runtime
