#include "project_resolver.hpp"

#include <cstdlib>
#include <system_error>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace coord::project {

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultStateDir = ".coord";

std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') return std::nullopt;
  return std::string(value);
}

bool IsDirectory(const fs::path& p) {
  std::error_code ec;
  return fs::is_directory(p, ec);
}

std::string DirectoryName(const fs::path& p) {
  auto normalized = p.lexically_normal();
  if (!normalized.has_filename()) normalized = normalized.parent_path();
  return normalized.filename().string();
}

} // namespace

ProjectResolver::ProjectResolver(const coord::runtime::config::ProjectsConfig& config)
    : default_project_(config.default_project()), state_dir_(config.state_dir().empty() ? kDefaultStateDir : config.state_dir()) {
  for (const auto& entry : config.entries()) {
    if (entry.id().empty() || entry.root().empty()) continue;
    entries_.push_back({entry.id(), fs::path(entry.root())});
  }
}

ProjectLocation ProjectResolver::Resolve(const std::optional<std::string>& project_id) const {
  if (project_id && !project_id->empty()) return ResolveId(*project_id);

  if (auto env_project = Env("COORD_PROJECT")) return ResolveId(*env_project);
  if (!default_project_.empty()) return ResolveId(default_project_);

  if (auto env_root = Env("COORD_PROJECT_ROOT")) {
    fs::path root(*env_root);
    if (!IsDirectory(root)) throw util::ProjectNotFound("COORD_PROJECT_ROOT is not a directory: " + *env_root);
    return Locate(DirectoryName(root), root);
  }

  throw util::ProjectNotFound("no project_id given and no default project configured; pass project_id or set COORD_PROJECT");
}

ProjectLocation ProjectResolver::ResolveId(const std::string& id) const {
  for (const auto& entry : entries_) {
    if (entry.id != id) continue;
    if (!IsDirectory(entry.root)) throw util::ProjectNotFound("project " + id + ": root does not exist: " + entry.root.string());
    return Locate(entry.id, entry.root);
  }

  fs::path as_path(id);
  if (as_path.is_absolute() && IsDirectory(as_path)) {
    return Locate(DirectoryName(as_path), as_path);
  }

  if (auto env_root = Env("COORD_PROJECT_ROOT")) {
    fs::path root(*env_root);
    if (DirectoryName(root) == id && IsDirectory(root)) return Locate(id, root);
  }

  throw util::ProjectNotFound("unknown project: " + id);
}

ProjectLocation ProjectResolver::Locate(std::string id, const fs::path& root) const {
  ProjectLocation location;
  location.id         = std::move(id);
  location.root       = root.lexically_normal();
  location.state_root = location.root / state_dir_ / "coordinator";
  return location;
}

} // namespace coord::project
