#include "sqlite_repository.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace coord::db::sqlite {

using coord::db::ErrorCode;
using coord::db::Result;

namespace {

// Finalizes on scope exit; prepare failures surface as StoreError.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    int rc = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
    if (rc != SQLITE_OK) {
      st_ = nullptr;
      throw util::StoreError(std::string("sqlite prepare: ") + sqlite3_errmsg(db), (rc & 0xff) == SQLITE_BUSY);
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// capabilities column: JSON array of strings

std::string EncodeCapabilities(const std::vector<std::string>& caps) {
  google::protobuf::ListValue list;
  for (const auto& c : caps) {
    list.add_values()->set_string_value(c);
  }
  std::string out;
  if (!google::protobuf::util::MessageToJsonString(list, &out).ok()) return "[]";
  return out;
}

std::vector<std::string> DecodeCapabilities(const std::string& json) {
  google::protobuf::ListValue list;
  if (!google::protobuf::util::JsonStringToMessage(json, &list).ok()) {
    throw util::StoreError("corrupt capabilities column: " + json, false);
  }
  std::vector<std::string> out;
  out.reserve(list.values_size());
  for (const auto& v : list.values()) {
    out.push_back(v.string_value());
  }
  return out;
}

model::AgentRecord ReadAgent(sqlite3_stmt* st) {
  model::AgentRecord r;
  r.agent_id          = ColText(st, 0);
  r.capabilities      = DecodeCapabilities(ColText(st, 1));
  r.status            = coord::model::ParseAgentStatus(ColText(st, 2)).value_or(coord::model::AgentStatus::kActive);
  r.current_task      = ColOptText(st, 3);
  r.registered_at_ms  = ColU64(st, 4);
  r.last_heartbeat_ms = ColU64(st, 5);
  return r;
}

model::LockRecord ReadLock(sqlite3_stmt* st) {
  model::LockRecord r;
  r.resource       = ColText(st, 0);
  r.owner_agent_id = ColText(st, 1);
  r.acquired_at_ms = ColU64(st, 2);
  r.expires_at_ms  = ColU64(st, 3);
  r.reason         = ColOptText(st, 4);
  return r;
}

model::MessageRecord ReadMessage(sqlite3_stmt* st) {
  model::MessageRecord r;
  r.message_id    = ColText(st, 0);
  r.to            = ColText(st, 1);
  r.from          = ColText(st, 2);
  r.intent        = ColText(st, 3);
  r.payload_json  = ColText(st, 4);
  r.reply_to      = ColOptText(st, 5);
  r.status        = coord::model::ParseMessageStatus(ColText(st, 6)).value_or(coord::model::MessageStatus::kPending);
  r.result_json   = ColOptText(st, 7);
  r.created_at_ms = ColU64(st, 8);
  r.expires_at_ms = ColU64(st, 9);
  r.updated_at_ms = ColU64(st, 10);
  return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord r;
  r.event_id     = ColU64(st, 0);
  r.timestamp_ms = ColU64(st, 1);
  r.agent_id     = ColText(st, 2);
  r.action       = ColText(st, 3);
  r.resource     = ColOptText(st, 4);
  r.reason       = ColOptText(st, 5);
  r.detail_json  = ColText(st, 6);
  return r;
}

void BindEventFilter(sqlite3_stmt* st, const EventQuery& q) {
  BindOptText(st, 1, q.agent_id);
  BindOptText(st, 2, q.action);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
  return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

SqliteTransaction& SqliteRepository::WriteTX(Transaction& t) {
  if (t.Mode() == TxMode::kReadOnly) {
    throw std::logic_error("sqlite store: write inside a read-only transaction");
  }
  return TX(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
  auto*     db = WriteTX(t).Handle();
  Statement st(db, sql::UPSERT_AGENT);

  BindText(st.get(), 1, r.agent_id);
  BindText(st.get(), 2, EncodeCapabilities(r.capabilities));
  BindText(st.get(), 3, std::string(coord::model::ToString(r.status)));
  BindOptText(st.get(), 4, r.current_task);
  BindU64(st.get(), 5, r.registered_at_ms);
  BindU64(st.get(), 6, r.last_heartbeat_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AgentRecord> SqliteRepository::GetAgent(Transaction& t, const std::string& agent_id) {
  Statement st(TX(t).Handle(), sql::SELECT_AGENT);
  BindText(st.get(), 1, agent_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadAgent(st.get());
}

std::vector<model::AgentRecord> SqliteRepository::ListAgents(Transaction& t) {
  Statement                       st(TX(t).Handle(), sql::SELECT_AGENTS);
  std::vector<model::AgentRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadAgent(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

Result SqliteRepository::UpsertLock(Transaction& t, const model::LockRecord& r) {
  auto*     db = WriteTX(t).Handle();
  Statement st(db, sql::UPSERT_LOCK);

  BindText(st.get(), 1, r.resource);
  BindText(st.get(), 2, r.owner_agent_id);
  BindU64(st.get(), 3, r.acquired_at_ms);
  BindU64(st.get(), 4, r.expires_at_ms);
  BindOptText(st.get(), 5, r.reason);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::LockRecord> SqliteRepository::GetLock(Transaction& t, const std::string& resource) {
  Statement st(TX(t).Handle(), sql::SELECT_LOCK);
  BindText(st.get(), 1, resource);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadLock(st.get());
}

std::vector<model::LockRecord> SqliteRepository::ListLocks(Transaction& t) {
  Statement                      st(TX(t).Handle(), sql::SELECT_LOCKS);
  std::vector<model::LockRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadLock(st.get()));
  }
  return out;
}

Result SqliteRepository::DeleteLock(Transaction& t, const std::string& resource) {
  auto*     db = WriteTX(t).Handle();
  Statement st(db, sql::DELETE_LOCK);
  BindText(st.get(), 1, resource);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteRepository::InsertMessage(Transaction& t, const model::MessageRecord& r) {
  auto*     db = WriteTX(t).Handle();
  Statement st(db, sql::INSERT_MESSAGE);

  BindText(st.get(), 1, r.message_id);
  BindText(st.get(), 2, r.to);
  BindText(st.get(), 3, r.from);
  BindText(st.get(), 4, r.intent);
  BindText(st.get(), 5, r.payload_json);
  BindOptText(st.get(), 6, r.reply_to);
  BindText(st.get(), 7, std::string(coord::model::ToString(r.status)));
  BindOptText(st.get(), 8, r.result_json);
  BindU64(st.get(), 9, r.created_at_ms);
  BindU64(st.get(), 10, r.expires_at_ms);
  BindU64(st.get(), 11, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "message exists: " + r.message_id);
  return Translate(db, rc);
}

std::optional<model::MessageRecord> SqliteRepository::GetMessage(Transaction& t, const std::string& message_id) {
  Statement st(TX(t).Handle(), sql::SELECT_MESSAGE);
  BindText(st.get(), 1, message_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadMessage(st.get());
}

Result SqliteRepository::UpdateMessage(Transaction& t, const model::MessageRecord& r) {
  auto*     db = WriteTX(t).Handle();
  Statement st(db, sql::UPDATE_MESSAGE);

  BindText(st.get(), 1, std::string(coord::model::ToString(r.status)));
  BindOptText(st.get(), 2, r.result_json);
  BindU64(st.get(), 3, r.updated_at_ms);
  BindText(st.get(), 4, r.message_id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "message not found: " + r.message_id);
  return Result::Ok();
}

std::vector<model::MessageRecord> SqliteRepository::ListMessages(Transaction& t, const MessageQuery& q) {
  Statement st(TX(t).Handle(), sql::SELECT_INBOX);

  BindText(st.get(), 1, q.to);
  if (q.status) {
    BindText(st.get(), 2, std::string(coord::model::ToString(*q.status)));
  } else {
    sqlite3_bind_null(st.get(), 2);
  }
  if (q.live_at_ms) {
    BindU64(st.get(), 3, *q.live_at_ms);
  } else {
    sqlite3_bind_null(st.get(), 3);
  }
  BindU64(st.get(), 4, q.limit);

  std::vector<model::MessageRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadMessage(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto*     db = WriteTX(t).Handle();
  Statement st(db, sql::INSERT_EVENT);

  BindU64(st.get(), 1, r.timestamp_ms);
  BindText(st.get(), 2, r.agent_id);
  BindText(st.get(), 3, r.action);
  BindOptText(st.get(), 4, r.resource);
  BindOptText(st.get(), 5, r.reason);
  BindText(st.get(), 6, r.detail_json);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;

  r.event_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(Transaction& t, const EventQuery& q) {
  Statement st(TX(t).Handle(), sql::SELECT_EVENTS);
  BindEventFilter(st.get(), q);
  BindU64(st.get(), 3, q.limit);

  std::vector<model::EventRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadEvent(st.get()));
  }
  return out;
}

uint64_t SqliteRepository::CountEvents(Transaction& t, const EventQuery& q) {
  Statement st(TX(t).Handle(), sql::COUNT_EVENTS);
  BindEventFilter(st.get(), q);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

} // namespace coord::db::sqlite
