#include "internal/project/project_resolver.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using coord::project::ProjectResolver;
using coord::runtime::config::ProjectsConfig;

fs::path MakeDir(const std::string& name) {
  auto dir = fs::temp_directory_path() / "coord_project_resolver_tests" / name;
  fs::create_directories(dir);
  return dir;
}

void ClearEnv() {
  ::unsetenv("COORD_PROJECT");
  ::unsetenv("COORD_PROJECT_ROOT");
}

bool ThrowsNotFound(const ProjectResolver& resolver, const std::optional<std::string>& id) {
  try {
    (void)resolver.Resolve(id);
  } catch (const coord::util::ProjectNotFound&) {
    return true;
  }
  return false;
}

void TestConfiguredEntry() {
  ClearEnv();
  auto root = MakeDir("cymoril");

  ProjectsConfig config;
  auto*          entry = config.add_entries();
  entry->set_id("cymoril");
  entry->set_root(root.string());

  ProjectResolver resolver(config);
  auto            location = resolver.Resolve(std::string("cymoril"));
  assert(location.id == "cymoril");
  assert(location.root == root.lexically_normal());
  assert(location.state_root == root.lexically_normal() / ".coord" / "coordinator");

  assert(ThrowsNotFound(resolver, std::string("unknown")));
}

void TestStateDirIsConfigurable() {
  ClearEnv();
  auto root = MakeDir("custom_state");

  ProjectsConfig config;
  config.set_state_dir(".state");
  ProjectResolver resolver(config);

  auto location = resolver.Resolve(root.string());
  assert(location.id == "custom_state");
  assert(location.state_root == root.lexically_normal() / ".state" / "coordinator");
}

void TestDefaultsWithoutId() {
  ClearEnv();
  auto root = MakeDir("fallback");

  ProjectsConfig  empty;
  ProjectResolver bare(empty);
  assert(ThrowsNotFound(bare, std::nullopt));

  ::setenv("COORD_PROJECT_ROOT", root.string().c_str(), 1);
  auto from_root = bare.Resolve(std::nullopt);
  assert(from_root.id == "fallback");

  // an id matching the root's directory name resolves to it
  assert(bare.Resolve(std::string("fallback")).root == root.lexically_normal());

  ProjectsConfig config;
  config.set_default_project("configured");
  auto* entry = config.add_entries();
  entry->set_id("configured");
  entry->set_root(MakeDir("configured").string());
  ProjectResolver with_default(config);
  assert(with_default.Resolve(std::nullopt).id == "configured");

  ::setenv("COORD_PROJECT", root.string().c_str(), 1);
  assert(with_default.Resolve(std::nullopt).id == "fallback");

  ClearEnv();
}

void TestMissingConfiguredRoot() {
  ClearEnv();

  ProjectsConfig config;
  auto*          entry = config.add_entries();
  entry->set_id("gone");
  entry->set_root("/nonexistent/coord/gone");

  ProjectResolver resolver(config);
  assert(ThrowsNotFound(resolver, std::string("gone")));
}

} // namespace

int main() {
  TestConfiguredEntry();
  TestStateDirIsConfigurable();
  TestDefaultsWithoutId();
  TestMissingConfiguredRoot();

  std::cout << "coord_unit_project_resolver: pass\n";
  return 0;
}
