#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/agent_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/lock_record.hpp"
#include "internal/db/model/message_record.hpp"

namespace coord::db {

/*
  Repository abstraction (the coordination Store).

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - A transaction that reads a lock row and then writes it cannot interleave
    with another writer (check-then-act is safe)
  - Event ids are assigned atomically and strictly increase

  One repository instance is scoped to exactly one project. The store is the
  only source of truth; callers re-read on every operation and cache nothing.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode) = 0;

  std::unique_ptr<Transaction> Begin() {
    return Begin(TxMode::kReadWrite);
  }

  // ---------------------------------------------------------------------
  // Agents
  // ---------------------------------------------------------------------

  virtual Result UpsertAgent(Transaction&, const model::AgentRecord&) = 0;

  virtual std::optional<model::AgentRecord> GetAgent(Transaction&, const std::string& agent_id) = 0;

  // Ordered by agent_id.
  virtual std::vector<model::AgentRecord> ListAgents(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Locks
  // ---------------------------------------------------------------------

  // Creates or overwrites the row for record.resource.
  virtual Result UpsertLock(Transaction&, const model::LockRecord&) = 0;

  virtual std::optional<model::LockRecord> GetLock(Transaction&, const std::string& resource) = 0;

  // Ordered by resource.
  virtual std::vector<model::LockRecord> ListLocks(Transaction&) = 0;

  // Deleting a missing row is not an error.
  virtual Result DeleteLock(Transaction&, const std::string& resource) = 0;

  // ---------------------------------------------------------------------
  // Messages
  // ---------------------------------------------------------------------

  virtual Result InsertMessage(Transaction&, const model::MessageRecord&) = 0;

  virtual std::optional<model::MessageRecord> GetMessage(Transaction&, const std::string& message_id) = 0;

  virtual Result UpdateMessage(Transaction&, const model::MessageRecord&) = 0;

  virtual std::vector<model::MessageRecord> ListMessages(Transaction&, const MessageQuery&) = 0;

  // ---------------------------------------------------------------------
  // Events (append-only)
  // ---------------------------------------------------------------------

  // Assigns record.event_id.
  virtual Result AppendEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::vector<model::EventRecord> ListEvents(Transaction&, const EventQuery&) = 0;

  // Number of events matching the filters, ignoring limit.
  virtual uint64_t CountEvents(Transaction&, const EventQuery&) = 0;
};

} // namespace coord::db
