#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace coord::db::memory {

namespace {

bool MatchesEvent(const model::EventRecord& e, const EventQuery& q) {
  if (q.agent_id && e.agent_id != *q.agent_id) return false;
  if (q.action && e.action != *q.action) return false;
  return true;
}

bool MatchesMessage(const model::MessageRecord& m, const MessageQuery& q) {
  if (m.to != q.to) return false;
  if (q.status && m.status != *q.status) return false;
  if (q.live_at_ms && m.expires_at_ms <= *q.live_at_ms) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Agents
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAgent(Transaction& t, const model::AgentRecord& r) {
  TX(t).Mutable().agents[r.agent_id] = r;
  return Result::Ok();
}

std::optional<model::AgentRecord> MemoryRepository::GetAgent(Transaction& t, const std::string& agent_id) {
  const auto& s  = TX(t).View();
  auto        it = s.agents.find(agent_id);
  if (it == s.agents.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AgentRecord> MemoryRepository::ListAgents(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::AgentRecord> out;
  out.reserve(s.agents.size());
  for (const auto& [_, record] : s.agents) {
    out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Locks
// ------------------------------------------------------------------

Result MemoryRepository::UpsertLock(Transaction& t, const model::LockRecord& r) {
  TX(t).Mutable().locks[r.resource] = r;
  return Result::Ok();
}

std::optional<model::LockRecord> MemoryRepository::GetLock(Transaction& t, const std::string& resource) {
  const auto& s  = TX(t).View();
  auto        it = s.locks.find(resource);
  if (it == s.locks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::LockRecord> MemoryRepository::ListLocks(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::LockRecord> out;
  out.reserve(s.locks.size());
  for (const auto& [_, record] : s.locks) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteLock(Transaction& t, const std::string& resource) {
  TX(t).Mutable().locks.erase(resource);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result MemoryRepository::InsertMessage(Transaction& t, const model::MessageRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.messages.contains(r.message_id)) return Result::Err(ErrorCode::AlreadyExists, "message exists: " + r.message_id);
  s.messages[r.message_id] = r;
  s.message_order.push_back(r.message_id);
  return Result::Ok();
}

std::optional<model::MessageRecord> MemoryRepository::GetMessage(Transaction& t, const std::string& message_id) {
  const auto& s  = TX(t).View();
  auto        it = s.messages.find(message_id);
  if (it == s.messages.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateMessage(Transaction& t, const model::MessageRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.messages.find(r.message_id);
  if (it == s.messages.end()) return Result::Err(ErrorCode::NotFound, "message not found: " + r.message_id);
  it->second = r;
  return Result::Ok();
}

std::vector<model::MessageRecord> MemoryRepository::ListMessages(Transaction& t, const MessageQuery& q) {
  const auto& s = TX(t).View();

  std::vector<const model::MessageRecord*> matches;
  for (const auto& id : s.message_order) {
    const auto& m = s.messages.at(id);
    if (MatchesMessage(m, q)) matches.push_back(&m);
  }

  // message_order is insertion order; created_at wins when a caller backdated
  std::stable_sort(matches.begin(), matches.end(),
                   [](const auto* a, const auto* b) { return a->created_at_ms < b->created_at_ms; });

  std::vector<model::MessageRecord> out;
  for (const auto* m : matches) {
    if (out.size() >= q.limit) break;
    out.push_back(*m);
  }
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto& s    = TX(t).Mutable();
  r.event_id = s.next_event_id++;
  s.events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, const EventQuery& q) {
  const auto&                     s = TX(t).View();
  std::vector<model::EventRecord> out;
  for (auto it = s.events.rbegin(); it != s.events.rend() && out.size() < q.limit; ++it) {
    if (MatchesEvent(*it, q)) out.push_back(*it);
  }
  return out;
}

uint64_t MemoryRepository::CountEvents(Transaction& t, const EventQuery& q) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.events.begin(), s.events.end(), [&](const auto& e) { return MatchesEvent(e, q); }));
}

} // namespace coord::db::memory
