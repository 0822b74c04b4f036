#include "migrations.hpp"

namespace coord::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& CoordinationSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS coord_agents (agent_id TEXT PRIMARY KEY, capabilities TEXT NOT NULL DEFAULT '[]', status TEXT NOT NULL, current_task TEXT, registered_at_ms INTEGER NOT NULL, last_heartbeat_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS coord_locks (resource TEXT PRIMARY KEY, owner_agent_id TEXT NOT NULL, acquired_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, reason TEXT);",
      "CREATE INDEX IF NOT EXISTS coord_locks_owner ON coord_locks(owner_agent_id);",
      "CREATE TABLE IF NOT EXISTS coord_messages (seq INTEGER PRIMARY KEY AUTOINCREMENT, message_id TEXT NOT NULL UNIQUE, recipient TEXT NOT NULL, sender TEXT NOT NULL, intent TEXT NOT NULL, payload TEXT NOT NULL, reply_to TEXT, status TEXT NOT NULL, result TEXT, created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS coord_messages_inbox ON coord_messages(recipient, status, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS coord_events (event_id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp_ms INTEGER NOT NULL, agent_id TEXT NOT NULL, action TEXT NOT NULL, resource TEXT, reason TEXT, detail TEXT);",
      "CREATE INDEX IF NOT EXISTS coord_events_agent ON coord_events(agent_id);",
      "CREATE INDEX IF NOT EXISTS coord_events_action ON coord_events(action);"};
  return kSchema;
}

} // namespace coord::db::sql
