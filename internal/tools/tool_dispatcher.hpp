#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace coord::service {
class CoordinationService;
}

namespace coord::tools {

struct ToolResult {
  bool        ok = false;
  std::string json; // result object, or {"error", "message", "details"}
};

/*
  JSON tool boundary.

  Arguments are a JSON object whose keys are the proto field names of the
  tool's request; unknown keys are rejected. Every failure, including
  malformed JSON and unknown tools, comes back as a structured error result.
  Nothing thrown below this layer escapes it.
*/
class ToolDispatcher {
 public:
  explicit ToolDispatcher(std::shared_ptr<service::CoordinationService> service);

  ToolResult Call(std::string_view tool, std::string_view arguments_json);

  // One stdio request: {"tool": NAME, "arguments": {...}}. Returns one line
  // of JSON without the trailing newline.
  std::string HandleLine(std::string_view line);

  // {"tools": [{"name", "description", "required", "optional"}]}
  static std::string CatalogJson();

 private:
  std::string Invoke(const std::string& tool, const std::string& arguments_json);

  std::shared_ptr<service::CoordinationService> service_;
};

} // namespace coord::tools
