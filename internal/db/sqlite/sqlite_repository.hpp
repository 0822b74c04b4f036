#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace coord::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static SqliteTransaction& WriteTX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
