#include "internal/runtime/server.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "coord/v1/coordination_service.grpc.pb.h"
#include "internal/factory.hpp"
#include "internal/grpc/coordination_server.hpp"

namespace {

using coord::runtime::Server;
using coord::runtime::ServerOptions;

void TestOptionsFromConfig() {
  coord::runtime::config::ServerConfig config;
  config.set_bind_address("127.0.0.1:50071");

  auto defaults = ServerOptions::FromConfig(config);
  assert(defaults.bind_address == "127.0.0.1:50071");
  assert(defaults.shutdown_grace == std::chrono::milliseconds(5000));

  config.mutable_shutdown_grace()->set_seconds(2);
  config.mutable_shutdown_grace()->set_nanos(500'000'000);
  assert(ServerOptions::FromConfig(config).shutdown_grace == std::chrono::milliseconds(2500));
}

void TestEmptyBindAddressFails() {
  Server server(ServerOptions{}, {});

  bool threw = false;
  try {
    server.Start();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  server.Stop();
}

std::shared_ptr<coord::service::CoordinationService> MemoryService() {
  ::unsetenv("COORD_PROJECT");
  ::unsetenv("COORD_PROJECT_ROOT");

  auto root = std::filesystem::temp_directory_path() / "coord_runtime_server_tests" / "cymoril";
  std::filesystem::create_directories(root);

  coord::runtime::config::RuntimeConfig config;
  config.mutable_store()->mutable_memory();
  config.mutable_projects()->set_default_project("cymoril");
  auto* entry = config.mutable_projects()->add_entries();
  entry->set_id("cymoril");
  entry->set_root(root.string());
  return coord::factory::Build(config).coordination_service;
}

void TestServesAndDrains() {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<coord::grpc::CoordinationServer>(MemoryService()));

  ServerOptions options;
  options.bind_address   = "127.0.0.1:0";
  options.shutdown_grace = std::chrono::milliseconds(200);
  Server server(options, std::move(services));

  const int port = server.Start();
  assert(port > 0);

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(port), ::grpc::InsecureChannelCredentials());
  auto stub    = coord::v1::CoordinationService::NewStub(channel);

  {
    ::grpc::ClientContext       ctx;
    coord::v1::RegisterRequest  req;
    coord::v1::RegisterResponse resp;
    req.set_agent_id("cymoril-code");
    req.add_capabilities("code");
    assert(stub->Register(&ctx, req, &resp).ok());
    assert(resp.agent_id() == "cymoril-code");
  }

  {
    ::grpc::ClientContext   ctx;
    coord::v1::LockRequest  req;
    coord::v1::LockResponse resp;
    req.set_agent_id("cymoril-code");
    req.set_resource("src/parser.rs");
    assert(stub->Lock(&ctx, req, &resp).ok());
    assert(resp.granted());
  }

  {
    ::grpc::ClientContext   ctx;
    coord::v1::LockRequest  req;
    coord::v1::LockResponse resp;
    req.set_agent_id("cymoril-test");
    req.set_resource("src/parser.rs");
    assert(stub->Lock(&ctx, req, &resp).error_code() == ::grpc::StatusCode::ABORTED);
  }

  server.Stop();
  server.Stop();

  // nothing is listening any more
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(500));
  coord::v1::StatusRequest  req;
  coord::v1::StatusResponse resp;
  assert(!stub->Status(&ctx, req, &resp).ok());
}

} // namespace

int main() {
  TestOptionsFromConfig();
  TestEmptyBindAddressFails();
  TestServesAndDrains();

  std::cout << "coord_unit_runtime_server: pass\n";
  return 0;
}
