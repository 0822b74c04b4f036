#include "project_space.hpp"

#include "internal/observability/logging.hpp"

namespace coord::core {

ProjectSpace::ProjectSpace(project::ProjectResolver resolver, RepositoryOpener opener, CoordinatorOptions options,
                           std::shared_ptr<util::TimeSource> time_source)
    : resolver_(std::move(resolver)), opener_(std::move(opener)), options_(options), time_source_(std::move(time_source)) {
}

std::shared_ptr<Coordinator> ProjectSpace::For(const std::optional<std::string>& project_id) {
  auto location = resolver_.Resolve(project_id);
  auto key      = location.state_root.string();

  std::lock_guard lock(mutex_);
  if (auto it = coordinators_.find(key); it != coordinators_.end()) return it->second;

  auto coordinator = std::make_shared<Coordinator>(opener_(location), options_, time_source_);
  coordinators_.emplace(key, coordinator);

  COORD_LOG_INFO("project opened", {observability::StringField("project_id", location.id),
                                    observability::StringField("state_root", location.state_root.string())});
  return coordinator;
}

} // namespace coord::core
