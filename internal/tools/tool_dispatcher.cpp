#include "tool_dispatcher.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/service/coordination_service.hpp"
#include "internal/service/error_detail.hpp"
#include "internal/tools/tool_catalog.hpp"
#include "internal/util/errors.hpp"

namespace coord::tools {

using google::protobuf::Struct;

namespace {

// Raised for names that match no tool or facade action.
class UnknownTool : public std::runtime_error {
 public:
  explicit UnknownTool(const std::string& name) : std::runtime_error("unknown tool: " + name), name_(name) {
  }

  const std::string& Name() const {
    return name_;
  }

 private:
  std::string name_;
};

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) throw std::runtime_error("serialize result: " + std::string(status.message()));
  return out;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json.empty() ? "{}" : json, message, options);
  if (!status.ok()) throw util::InvalidArgument("invalid arguments: " + std::string(status.message()));
}

template <typename Req, typename Resp>
std::string Run(service::CoordinationService& svc, Resp (service::CoordinationService::*method)(const Req&), const std::string& json) {
  Req req;
  FromJson(json, &req);
  return ToJson((svc.*method)(req));
}

void SetString(Struct& s, const std::string& key, const std::string& value) {
  (*s.mutable_fields())[key].set_string_value(value);
}

std::string ErrorJson(const std::string& code, const std::string& message, const Struct& details) {
  Struct error;
  SetString(error, "error", code);
  SetString(error, "message", message);
  *(*error.mutable_fields())["details"].mutable_struct_value() = details;

  std::string out;
  if (!google::protobuf::util::MessageToJsonString(error, &out).ok()) {
    return R"({"error":"INTERNAL","message":"failed to serialize error","details":{}})";
  }
  return out;
}

std::string TranslateError(const std::exception& e) {
  if (const auto* ex = dynamic_cast<const UnknownTool*>(&e)) {
    Struct details;
    SetString(details, "tool", ex->Name());
    auto* available = (*details.mutable_fields())["available"].mutable_list_value();
    for (const auto& spec : Catalog()) {
      available->add_values()->set_string_value(spec.name);
    }
    available->add_values()->set_string_value(kFacadeTool);
    return ErrorJson("UNKNOWN_TOOL", ex->what(), details);
  }

  const auto described = service::DescribeError(e);
  return ErrorJson(described.detail.code(), described.message, described.detail.details());
}

Struct ParseObject(std::string_view json, const char* what) {
  Struct object;
  auto   status = google::protobuf::util::JsonStringToMessage(json.empty() ? "{}" : std::string(json), &object);
  if (!status.ok()) throw util::InvalidArgument(std::string(what) + " must be a JSON object: " + std::string(status.message()));
  return object;
}

std::string Serialize(const Struct& object) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(object, &out);
  if (!status.ok()) throw std::runtime_error("serialize arguments: " + std::string(status.message()));
  return out;
}

} // namespace

ToolDispatcher::ToolDispatcher(std::shared_ptr<service::CoordinationService> service) : service_(std::move(service)) {
}

ToolResult ToolDispatcher::Call(std::string_view tool, std::string_view arguments_json) {
  ToolResult result;
  try {
    std::string name(tool);
    std::string arguments(arguments_json);

    if (name == kFacadeTool) {
      auto object = ParseObject(arguments, "arguments");
      auto it     = object.fields().find("action");
      if (it == object.fields().end() || it->second.string_value().empty()) throw util::RequiredFieldMissing("action");

      name = "coord_" + it->second.string_value();
      if (!FindTool(name)) throw UnknownTool(it->second.string_value());
      object.mutable_fields()->erase("action");
      arguments = Serialize(object);
    }

    result.json = Invoke(name, arguments);
    result.ok   = true;
  } catch (const std::exception& e) {
    result.json = TranslateError(e);
    result.ok   = false;
  }
  return result;
}

std::string ToolDispatcher::Invoke(const std::string& tool, const std::string& arguments_json) {
  auto& svc = *service_;

  if (tool == "coord_register") return Run(svc, &service::CoordinationService::Register, arguments_json);
  if (tool == "coord_heartbeat") return Run(svc, &service::CoordinationService::Heartbeat, arguments_json);
  if (tool == "coord_lock") return Run(svc, &service::CoordinationService::Lock, arguments_json);
  if (tool == "coord_unlock") return Run(svc, &service::CoordinationService::Unlock, arguments_json);
  if (tool == "coord_status") return Run(svc, &service::CoordinationService::Status, arguments_json);
  if (tool == "coord_log") return Run(svc, &service::CoordinationService::Log, arguments_json);
  if (tool == "coord_send") return Run(svc, &service::CoordinationService::Send, arguments_json);
  if (tool == "coord_inbox") return Run(svc, &service::CoordinationService::Inbox, arguments_json);
  if (tool == "coord_ack") return Run(svc, &service::CoordinationService::Ack, arguments_json);

  throw UnknownTool(tool);
}

std::string ToolDispatcher::HandleLine(std::string_view line) {
  std::string tool;
  std::string arguments;
  try {
    auto request = ParseObject(line, "request");

    auto tool_it = request.fields().find("tool");
    if (tool_it == request.fields().end() || tool_it->second.string_value().empty()) throw util::RequiredFieldMissing("tool");
    tool = tool_it->second.string_value();

    auto args_it = request.fields().find("arguments");
    if (args_it != request.fields().end()) {
      if (!args_it->second.has_struct_value()) throw util::InvalidArgument("arguments must be a JSON object");
      arguments = Serialize(args_it->second.struct_value());
    }
  } catch (const std::exception& e) {
    return TranslateError(e);
  }

  return Call(tool, arguments).json;
}

std::string ToolDispatcher::CatalogJson() {
  Struct root;
  auto*  tools = (*root.mutable_fields())["tools"].mutable_list_value();
  for (const auto& spec : Catalog()) {
    Struct entry;
    SetString(entry, "name", spec.name);
    SetString(entry, "description", spec.description);
    auto* required = (*entry.mutable_fields())["required"].mutable_list_value();
    for (const auto& f : spec.required) required->add_values()->set_string_value(f);
    auto* optional = (*entry.mutable_fields())["optional"].mutable_list_value();
    for (const auto& f : spec.optional) optional->add_values()->set_string_value(f);
    *tools->add_values()->mutable_struct_value() = entry;
  }
  return Serialize(root);
}

} // namespace coord::tools
