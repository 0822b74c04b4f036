#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace coord::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  using Repository::Begin;
  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  Result UpsertAgent(Transaction&, const model::AgentRecord&) override;
  std::optional<model::AgentRecord> GetAgent(Transaction&, const std::string&) override;
  std::vector<model::AgentRecord> ListAgents(Transaction&) override;

  Result UpsertLock(Transaction&, const model::LockRecord&) override;
  std::optional<model::LockRecord> GetLock(Transaction&, const std::string&) override;
  std::vector<model::LockRecord> ListLocks(Transaction&) override;
  Result DeleteLock(Transaction&, const std::string&) override;

  Result InsertMessage(Transaction&, const model::MessageRecord&) override;
  std::optional<model::MessageRecord> GetMessage(Transaction&, const std::string&) override;
  Result UpdateMessage(Transaction&, const model::MessageRecord&) override;
  std::vector<model::MessageRecord> ListMessages(Transaction&, const MessageQuery&) override;

  Result AppendEvent(Transaction&, model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const EventQuery&) override;
  uint64_t CountEvents(Transaction&, const EventQuery&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::AgentRecord> agents;
    std::map<std::string, model::LockRecord>  locks;

    std::unordered_map<std::string, model::MessageRecord> messages;
    std::vector<std::string>                              message_order;

    std::vector<model::EventRecord> events;
    uint64_t                        next_event_id = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
