#pragma once

namespace coord::db::sql {

/*
  Canonical SQL for the coordination store.

  Written in the SQLite dialect. Timestamps are unix milliseconds, payload
  and result columns hold JSON object text.
*/

// agents

static constexpr const char* UPSERT_AGENT =
    "INSERT INTO coord_agents(agent_id,capabilities,status,current_task,registered_at_ms,last_heartbeat_ms)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(agent_id) DO UPDATE SET"
    " capabilities=excluded.capabilities,"
    " status=excluded.status,"
    " current_task=excluded.current_task,"
    " registered_at_ms=excluded.registered_at_ms,"
    " last_heartbeat_ms=excluded.last_heartbeat_ms;";

static constexpr const char* SELECT_AGENT =
    "SELECT agent_id,capabilities,status,current_task,registered_at_ms,last_heartbeat_ms"
    " FROM coord_agents WHERE agent_id=?;";

static constexpr const char* SELECT_AGENTS =
    "SELECT agent_id,capabilities,status,current_task,registered_at_ms,last_heartbeat_ms"
    " FROM coord_agents ORDER BY agent_id;";

// locks

static constexpr const char* UPSERT_LOCK =
    "INSERT INTO coord_locks(resource,owner_agent_id,acquired_at_ms,expires_at_ms,reason)"
    " VALUES(?,?,?,?,?)"
    " ON CONFLICT(resource) DO UPDATE SET"
    " owner_agent_id=excluded.owner_agent_id,"
    " acquired_at_ms=excluded.acquired_at_ms,"
    " expires_at_ms=excluded.expires_at_ms,"
    " reason=excluded.reason;";

static constexpr const char* SELECT_LOCK =
    "SELECT resource,owner_agent_id,acquired_at_ms,expires_at_ms,reason"
    " FROM coord_locks WHERE resource=?;";

static constexpr const char* SELECT_LOCKS =
    "SELECT resource,owner_agent_id,acquired_at_ms,expires_at_ms,reason"
    " FROM coord_locks ORDER BY resource;";

static constexpr const char* DELETE_LOCK =
    "DELETE FROM coord_locks WHERE resource=?;";

// messages

static constexpr const char* INSERT_MESSAGE =
    "INSERT INTO coord_messages(message_id,recipient,sender,intent,payload,reply_to,status,result,"
    "created_at_ms,expires_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_MESSAGE =
    "SELECT message_id,recipient,sender,intent,payload,reply_to,status,result,"
    "created_at_ms,expires_at_ms,updated_at_ms"
    " FROM coord_messages WHERE message_id=?;";

static constexpr const char* UPDATE_MESSAGE =
    "UPDATE coord_messages SET status=?,result=?,updated_at_ms=? WHERE message_id=?;";

// Optional filters are bound as NULL to disable them.
static constexpr const char* SELECT_INBOX =
    "SELECT message_id,recipient,sender,intent,payload,reply_to,status,result,"
    "created_at_ms,expires_at_ms,updated_at_ms"
    " FROM coord_messages"
    " WHERE recipient=?1"
    " AND (?2 IS NULL OR status=?2)"
    " AND (?3 IS NULL OR expires_at_ms>?3)"
    " ORDER BY created_at_ms ASC, seq ASC"
    " LIMIT ?4;";

// events

static constexpr const char* INSERT_EVENT =
    "INSERT INTO coord_events(timestamp_ms,agent_id,action,resource,reason,detail)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_EVENTS =
    "SELECT event_id,timestamp_ms,agent_id,action,resource,reason,detail"
    " FROM coord_events"
    " WHERE (?1 IS NULL OR agent_id=?1)"
    " AND (?2 IS NULL OR action=?2)"
    " ORDER BY event_id DESC"
    " LIMIT ?3;";

static constexpr const char* COUNT_EVENTS =
    "SELECT COUNT(*) FROM coord_events"
    " WHERE (?1 IS NULL OR agent_id=?1)"
    " AND (?2 IS NULL OR action=?2);";

} // namespace coord::db::sql
