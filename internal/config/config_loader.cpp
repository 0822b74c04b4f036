#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <set>
#include <stdexcept>

namespace coord::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

constexpr const char* kImplicitConfigPath  = "coordinator.yaml";
constexpr const char* kDefaultSqliteFile    = "coordination.db";
constexpr uint32_t    kDefaultBusyTimeoutMs = 5000;
constexpr const char* kDefaultStateDir      = ".coord";
constexpr const char* kDefaultBindAddress   = "127.0.0.1:50071";

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars ("600", 'true') stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

coord::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  coord::runtime::config::RuntimeConfig config;

  // empty file
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level of " + path + " must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

coord::runtime::config::RuntimeConfig ConfigLoader::Load(const std::optional<std::string>& path) {
  coord::runtime::config::RuntimeConfig config;

  if (path && !path->empty()) {
    if (!std::filesystem::exists(*path)) {
      throw std::runtime_error("Config file not found: " + *path);
    }
    config = LoadFromYaml(*path);
  } else if (std::filesystem::exists(kImplicitConfigPath)) {
    config = LoadFromYaml(kImplicitConfigPath);
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(coord::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* store = config.mutable_store();
  if (!store->has_memory() && !store->has_sqlite()) {
    store->mutable_sqlite();
  }
  if (store->has_sqlite()) {
    if (store->sqlite().filename().empty()) store->mutable_sqlite()->set_filename(kDefaultSqliteFile);
    if (store->sqlite().busy_timeout_ms() == 0) store->mutable_sqlite()->set_busy_timeout_ms(kDefaultBusyTimeoutMs);
  }

  if (config.projects().state_dir().empty()) {
    config.mutable_projects()->set_state_dir(kDefaultStateDir);
  }
}

namespace {

void Invalid(const std::string& key, const std::string& why) {
  throw std::runtime_error("Invalid configuration: " + key + " " + why);
}

bool IsPositive(const google::protobuf::Duration& d) {
  return d.seconds() > 0 || (d.seconds() == 0 && d.nanos() > 0);
}

void CheckPositive(bool has, const google::protobuf::Duration& d, const std::string& key) {
  if (has && !IsPositive(d)) Invalid(key, "must be positive");
}

void CheckLimits(uint32_t default_limit, uint32_t max_limit, const std::string& prefix) {
  if (default_limit != 0 && max_limit != 0 && default_limit > max_limit) {
    Invalid("coordination.default_" + prefix + "_limit", "exceeds coordination.max_" + prefix + "_limit");
  }
}

} // namespace

void ConfigLoader::Validate(const coord::runtime::config::RuntimeConfig& config) {
  const auto& coordination = config.coordination();
  CheckPositive(coordination.has_lease_ttl(), coordination.lease_ttl(), "coordination.lease_ttl");
  CheckPositive(coordination.has_staleness_ttl(), coordination.staleness_ttl(), "coordination.staleness_ttl");
  CheckPositive(coordination.has_heartbeat_interval(), coordination.heartbeat_interval(), "coordination.heartbeat_interval");
  CheckPositive(coordination.has_message_ttl(), coordination.message_ttl(), "coordination.message_ttl");

  // an agent heartbeating on schedule must never look stale
  if (coordination.has_staleness_ttl() && coordination.has_heartbeat_interval() &&
      coordination.staleness_ttl().seconds() <= coordination.heartbeat_interval().seconds()) {
    Invalid("coordination.staleness_ttl", "must be longer than coordination.heartbeat_interval");
  }

  CheckLimits(coordination.default_inbox_limit(), coordination.max_inbox_limit(), "inbox");
  CheckLimits(coordination.default_log_limit(), coordination.max_log_limit(), "log");

  if (config.store().has_sqlite()) {
    const auto& filename = config.store().sqlite().filename();
    if (filename.find('/') != std::string::npos) Invalid("store.sqlite.filename", "must be a bare file name");
  }

  const auto& projects = config.projects();
  if (std::filesystem::path(projects.state_dir()).is_absolute()) {
    Invalid("projects.state_dir", "must be relative to the project root");
  }

  std::set<std::string> ids;
  for (int i = 0; i < projects.entries_size(); ++i) {
    const auto& entry = projects.entries(i);
    const auto  key   = "projects.entries[" + std::to_string(i) + "]";
    if (entry.id().empty()) Invalid(key + ".id", "is required");
    if (!ids.insert(entry.id()).second) Invalid(key + ".id", "duplicates '" + entry.id() + "'");
    if (!std::filesystem::path(entry.root()).is_absolute()) Invalid(key + ".root", "must be an absolute path");
  }
}

std::string ConfigLoader::ToJson(const coord::runtime::config::RuntimeConfig& config) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(config, &out, options);
  if (!status.ok()) throw std::runtime_error("render config: " + std::string(status.message()));
  return out;
}

} // namespace coord::config
