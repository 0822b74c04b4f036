#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace coord::runtime::config {
class ProjectsConfig;
}

namespace coord::project {

struct ProjectLocation {
  std::string           id;
  std::filesystem::path root;
  std::filesystem::path state_root; // <root>/<state_dir>/coordinator
};

/*
  Maps an optional project id to a project root.

  With an id:
    1. a configured project entry
    2. an absolute path to an existing directory
    3. $COORD_PROJECT_ROOT, when its directory name equals the id
  Without an id:
    $COORD_PROJECT, then projects.default_project, then $COORD_PROJECT_ROOT.

  Anything else throws util::ProjectNotFound.
*/
class ProjectResolver {
 public:
  explicit ProjectResolver(const coord::runtime::config::ProjectsConfig& config);

  ProjectLocation Resolve(const std::optional<std::string>& project_id) const;

 private:
  struct Entry {
    std::string           id;
    std::filesystem::path root;
  };

  ProjectLocation ResolveId(const std::string& id) const;
  ProjectLocation Locate(std::string id, const std::filesystem::path& root) const;

  std::string        default_project_;
  std::string        state_dir_;
  std::vector<Entry> entries_;
};

} // namespace coord::project
