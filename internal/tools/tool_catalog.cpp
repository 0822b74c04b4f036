#include "tool_catalog.hpp"

namespace coord::tools {

const std::vector<ToolSpec>& Catalog() {
  static const std::vector<ToolSpec> kCatalog = {
      {"coord_register",
       "Register an agent with its capabilities. Idempotent; re-registering replaces capabilities.",
       {"agent_id"},
       {"capabilities", "project_id"}},
      {"coord_heartbeat",
       "Report liveness, optionally with current task and status (active, busy, idle). Releases locks held by stale agents.",
       {"agent_id"},
       {"current_task", "status", "project_id"}},
      {"coord_lock",
       "Take an exclusive lease on a resource. Re-locking by the owner refreshes it; a lock held by another agent fails with LOCK_CONFLICT.",
       {"agent_id", "resource"},
       {"reason", "project_id"}},
      {"coord_unlock", "Release a lease. Only the owner may release it.", {"agent_id", "resource"}, {"project_id"}},
      {"coord_status", "List agents, live locks and stale agents.", {}, {"project_id"}},
      {"coord_log", "Read the coordination event log, newest first.", {}, {"limit", "agent_id", "action", "project_id"}},
      {"coord_send",
       "Send a message to another agent's inbox.",
       {"to", "from", "intent", "payload"},
       {"reply_to", "ttl_ms", "project_id"}},
      {"coord_inbox", "Read messages addressed to an agent, oldest first (default status pending).", {"agent_id"}, {"status", "limit", "project_id"}},
      {"coord_ack",
       "Acknowledge a message. With a result the message completes; without one a pending message becomes acked.",
       {"message_id", "agent_id"},
       {"result", "project_id"}},
  };
  return kCatalog;
}

const ToolSpec* FindTool(const std::string& name) {
  for (const auto& spec : Catalog()) {
    if (spec.name == name) return &spec;
  }
  return nullptr;
}

} // namespace coord::tools
