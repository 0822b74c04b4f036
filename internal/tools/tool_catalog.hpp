#pragma once

#include <string>
#include <vector>

namespace coord::tools {

struct ToolSpec {
  std::string              name;
  std::string              description;
  std::vector<std::string> required;
  std::vector<std::string> optional;
};

// The nine coord_* tools, in presentation order.
const std::vector<ToolSpec>& Catalog();

// Grouped entry point: {"action": "<lock|unlock|...>", ...tool arguments}.
inline constexpr const char* kFacadeTool = "coordinator";

const ToolSpec* FindTool(const std::string& name);

} // namespace coord::tools
