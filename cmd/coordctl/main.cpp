#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tools/tool_dispatcher.hpp"

static void Usage() {
  std::cerr << "Usage:\n"
            << "  coordctl [--config <config.yaml>] [--project <id>] <tool> [json_arguments]\n"
            << "  coordctl [--config <config.yaml>] [--project <id>] serve\n"
            << "  coordctl tools\n"
            << "\n"
            << "  <tool> is one of coord_register, coord_heartbeat, coord_lock, coord_unlock,\n"
            << "  coord_status, coord_log, coord_send, coord_inbox, coord_ack, or coordinator\n"
            << "  with an \"action\" argument.\n"
            << "  serve reads {\"tool\": ..., \"arguments\": {...}} lines on stdin and writes\n"
            << "  one JSON result per line on stdout.\n";
}

static int Serve(coord::tools::ToolDispatcher& tools) {
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    std::cout << tools.HandleLine(line) << std::endl;
  }
  return 0;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> project;

  int i = 1;
  for (; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--project" && i + 1 < argc) {
      project = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else {
      break;
    }
  }

  if (i >= argc) {
    Usage();
    return 1;
  }

  std::string cmd = argv[i++];

  if (cmd == "tools") {
    std::cout << coord::tools::ToolDispatcher::CatalogJson() << std::endl;
    return 0;
  }

  std::string arguments = i < argc ? argv[i++] : "{}";
  if (i < argc) {
    Usage();
    return 1;
  }

  // stderr logger before anything can fail; the loaded config replaces it
  coord::observability::InitializeLogging(coord::runtime::config::RuntimeConfig{});

  try {
    auto config = coord::config::ConfigLoader::Load(config_path);
    coord::observability::InitializeLogging(config);

    // --project behaves like COORD_PROJECT for this invocation
    if (project) {
      ::setenv("COORD_PROJECT", project->c_str(), 1);
    }

    auto app = coord::factory::Build(config);

    if (cmd == "serve") {
      COORD_LOG_INFO("coordctl serving on stdio");
      int rc = Serve(*app.tools);
      coord::observability::ShutdownLogging();
      return rc;
    }

    auto result = app.tools->Call(cmd, arguments);
    std::cout << result.json << std::endl;
    coord::observability::ShutdownLogging();
    return result.ok ? 0 : 3;
  } catch (const std::exception& e) {
    COORD_LOG_ERROR("Fatal error", {coord::observability::StringField("error", e.what())});
    coord::observability::ShutdownLogging();
    return 2;
  }
}
