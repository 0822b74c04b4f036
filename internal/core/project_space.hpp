#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/core/coordinator.hpp"
#include "internal/project/project_resolver.hpp"

namespace coord::core {

/*
  Routes a request's optional project_id to that project's Coordinator.

  Coordinators are opened on first use and kept for the life of the space;
  they hold a store connection only, never coordination state, so two
  projects never share anything.
*/
class ProjectSpace {
 public:
  using RepositoryOpener = std::function<std::shared_ptr<db::Repository>(const project::ProjectLocation&)>;

  ProjectSpace(project::ProjectResolver resolver, RepositoryOpener opener, CoordinatorOptions options,
               std::shared_ptr<util::TimeSource> time_source = util::SystemTime());

  std::shared_ptr<Coordinator> For(const std::optional<std::string>& project_id);

  project::ProjectLocation Resolve(const std::optional<std::string>& project_id) const {
    return resolver_.Resolve(project_id);
  }

 private:
  project::ProjectResolver          resolver_;
  RepositoryOpener                  opener_;
  CoordinatorOptions                options_;
  std::shared_ptr<util::TimeSource> time_source_;

  std::mutex                                          mutex_;
  std::map<std::string, std::shared_ptr<Coordinator>> coordinators_; // by state_root
};

} // namespace coord::core
