#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/project/project_resolver.hpp"
#include "internal/util/time.hpp"

namespace coord::core {
class ProjectSpace;
}
namespace coord::service {
class CoordinationService;
}
namespace coord::tools {
class ToolDispatcher;
}

namespace coord::factory {

/*
  Application

  Owns all long-lived objects used by the front ends (coordctl, coordd).
  Everything here lives for the lifetime of the process. Transport adapters
  (gRPC servers) are built by the binary that needs them.
*/
struct Application {
  std::shared_ptr<core::ProjectSpace>           projects;
  std::shared_ptr<service::CoordinationService> coordination_service;
  std::shared_ptr<tools::ToolDispatcher>        tools;
};

/*
  Opens (and bootstraps) one project's store.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const coord::runtime::config::RuntimeConfig& config,
                                                const project::ProjectLocation&              location);

// Build full application dependency graph
Application Build(const coord::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<util::TimeSource>            time_source = util::SystemTime());

} // namespace coord::factory
