#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/coordination_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void ShutdownTelemetry() {
  coord::observability::ShutdownMetrics();
  coord::observability::ShutdownTracing();
  coord::observability::ShutdownLogging();
}

struct Args {
  std::optional<std::string> config_path;
  bool                       check_config = false;
};

std::optional<Args> ParseArgs(int argc, char** argv) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--check-config") {
      args.check_config = true;
    } else if (!arg.empty() && arg[0] != '-' && !args.config_path) {
      args.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  return args;
}

} // namespace

int main(int argc, char** argv) {
  const auto args = ParseArgs(argc, argv);
  if (!args) {
    std::cerr << "usage: coordd [--check-config] [--config <coordinator.yaml> | <coordinator.yaml>]" << std::endl;
    return 1;
  }

  try {
    auto config = coord::config::ConfigLoader::Load(args->config_path);
    if (args->check_config) {
      // effective configuration after defaults
      std::cout << coord::config::ConfigLoader::ToJson(config);
      return 0;
    }

    coord::observability::InitializeLogging(config);
    coord::observability::InitializeTracing(config);
    coord::observability::InitializeMetrics(config);

    auto app = coord::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<coord::grpc::CoordinationServer>(app.coordination_service));

    coord::runtime::Server server(coord::runtime::ServerOptions::FromConfig(config.server()), std::move(services));

    // handlers go in before Start so an early SIGTERM still drains cleanly
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    COORD_LOG_INFO("coordd stopping");
    server.Stop();
    ShutdownTelemetry();
  } catch (const std::exception& e) {
    COORD_LOG_ERROR("coordd failed", {coord::observability::StringField("error", e.what())});
    ShutdownTelemetry();
    return 2;
  }

  return 0;
}
