#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if COORD_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using coord::db::ErrorCode;
using coord::db::EventQuery;
using coord::db::MessageQuery;
using coord::db::Repository;
using coord::db::TxMode;
using coord::db::memory::MemoryRepository;
using coord::db::model::AgentRecord;
using coord::db::model::EventRecord;
using coord::db::model::LockRecord;
using coord::db::model::MessageRecord;
using coord::model::AgentStatus;
using coord::model::MessageStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

void VerifyAgentReadWrite(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  AgentRecord agent{.agent_id          = prefix + "-b",
                    .capabilities      = {"code", "review"},
                    .status            = AgentStatus::kBusy,
                    .current_task      = "parser",
                    .registered_at_ms  = 100,
                    .last_heartbeat_ms = 200};
  assert(repo.UpsertAgent(*tx, agent));

  AgentRecord other{.agent_id = prefix + "-a", .registered_at_ms = 50, .last_heartbeat_ms = 50};
  assert(repo.UpsertAgent(*tx, other));

  auto loaded = repo.GetAgent(*tx, prefix + "-b");
  assert(loaded.has_value());
  assert(loaded->capabilities.size() == 2);
  assert(loaded->capabilities[1] == "review");
  assert(loaded->status == AgentStatus::kBusy);
  assert(loaded->current_task.value() == "parser");
  assert(loaded->last_heartbeat_ms == 200);

  auto no_task = repo.GetAgent(*tx, prefix + "-a");
  assert(no_task.has_value());
  assert(!no_task->current_task.has_value());
  assert(no_task->capabilities.empty());

  // upsert replaces
  agent.current_task.reset();
  agent.last_heartbeat_ms = 300;
  assert(repo.UpsertAgent(*tx, agent));
  assert(!repo.GetAgent(*tx, prefix + "-b")->current_task.has_value());

  // ordered by id
  std::vector<std::string> ids;
  for (const auto& a : repo.ListAgents(*tx)) {
    if (a.agent_id.rfind(prefix, 0) == 0) ids.push_back(a.agent_id);
  }
  assert(ids.size() == 2);
  assert(ids[0] == prefix + "-a");

  assert(!repo.GetAgent(*tx, prefix + "-missing").has_value());
  tx->Commit();
}

void VerifyLockReadWrite(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  LockRecord lock{.resource = prefix + "/src/lib.rs", .owner_agent_id = "cymoril-code", .acquired_at_ms = 10, .expires_at_ms = 20, .reason = "edit"};
  assert(repo.UpsertLock(*tx, lock));

  auto loaded = repo.GetLock(*tx, lock.resource);
  assert(loaded.has_value());
  assert(loaded->owner_agent_id == "cymoril-code");
  assert(loaded->reason.value() == "edit");

  // at most one row per resource
  lock.owner_agent_id = "cymoril-test";
  lock.reason.reset();
  assert(repo.UpsertLock(*tx, lock));
  loaded = repo.GetLock(*tx, lock.resource);
  assert(loaded->owner_agent_id == "cymoril-test");
  assert(!loaded->reason.has_value());

  std::size_t matching = 0;
  for (const auto& l : repo.ListLocks(*tx)) {
    if (l.resource == lock.resource) ++matching;
  }
  assert(matching == 1);

  assert(repo.DeleteLock(*tx, lock.resource));
  assert(!repo.GetLock(*tx, lock.resource).has_value());
  // deleting a missing row is fine
  assert(repo.DeleteLock(*tx, lock.resource));
  tx->Commit();
}

void VerifyMessageReadWrite(Repository& repo, const std::string& prefix) {
  const auto recipient = prefix + "-inbox";
  auto       tx        = repo.Begin();

  MessageRecord first{.message_id    = prefix + "-m1",
                      .to            = recipient,
                      .from          = "cymoril-code",
                      .intent        = "run_tests",
                      .payload_json  = R"({"suite":"parser"})",
                      .created_at_ms = 1000,
                      .expires_at_ms = 5000,
                      .updated_at_ms = 1000};
  MessageRecord second = first;
  second.message_id    = prefix + "-m2";
  second.reply_to      = first.message_id;
  second.created_at_ms = 2000;
  second.expires_at_ms = 3000;

  assert(repo.InsertMessage(*tx, first));
  assert(repo.InsertMessage(*tx, second));

  auto duplicate = repo.InsertMessage(*tx, first);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  MessageQuery query{.to = recipient, .status = MessageStatus::kPending, .live_at_ms = 1500, .limit = 10};
  auto         inbox = repo.ListMessages(*tx, query);
  assert(inbox.size() == 2);
  assert(inbox[0].message_id == first.message_id);
  assert(inbox[1].reply_to.value() == first.message_id);
  assert(inbox[0].payload_json == R"({"suite":"parser"})");

  // second has expired by 3000
  query.live_at_ms = 3000;
  inbox            = repo.ListMessages(*tx, query);
  assert(inbox.size() == 1);
  assert(inbox[0].message_id == first.message_id);

  query.live_at_ms = 1500;
  query.limit      = 1;
  assert(repo.ListMessages(*tx, query).size() == 1);

  first.status        = MessageStatus::kCompleted;
  first.result_json   = R"({"passed":true})";
  first.updated_at_ms = 1600;
  assert(repo.UpdateMessage(*tx, first));

  auto loaded = repo.GetMessage(*tx, first.message_id);
  assert(loaded->status == MessageStatus::kCompleted);
  assert(loaded->result_json.value() == R"({"passed":true})");

  query.limit  = 10;
  query.status = MessageStatus::kCompleted;
  assert(repo.ListMessages(*tx, query).size() == 1);

  MessageRecord ghost = first;
  ghost.message_id    = prefix + "-ghost";
  auto missing        = repo.UpdateMessage(*tx, ghost);
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyEventReadWrite(Repository& repo, const std::string& prefix) {
  const auto agent = prefix + "-agent";
  auto       tx    = repo.Begin();

  uint64_t last_id = 0;
  for (int i = 0; i < 4; ++i) {
    EventRecord event{.timestamp_ms = NowMs(), .agent_id = agent, .action = i % 2 == 0 ? "lock_acquired" : "heartbeat"};
    if (i % 2 == 0) event.resource = "file-" + std::to_string(i);
    assert(repo.AppendEvent(*tx, event));
    assert(event.event_id > last_id);
    last_id = event.event_id;
  }

  EventRecord with_detail{.timestamp_ms = NowMs(), .agent_id = agent, .action = "lock_released", .resource = "file-0", .reason = "unlock",
                          .detail_json = R"({"released_by":"x"})"};
  assert(repo.AppendEvent(*tx, with_detail));
  tx->Commit();

  auto       read = repo.Begin();
  EventQuery query{.agent_id = agent, .limit = 2};
  auto       events = repo.ListEvents(*read, query);
  assert(events.size() == 2);
  assert(events[0].action == "lock_released");
  assert(events[0].reason.value() == "unlock");
  assert(events[0].detail_json == R"({"released_by":"x"})");
  assert(events[1].event_id < events[0].event_id);
  assert(repo.CountEvents(*read, query) == 5);

  query.action = "lock_acquired";
  assert(repo.CountEvents(*read, query) == 2);
  assert(repo.ListEvents(*read, query)[0].resource.value() == "file-2");
  read->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    AgentRecord agent{.agent_id = prefix + "-ghost", .registered_at_ms = 1, .last_heartbeat_ms = 1};
    assert(repo.UpsertAgent(*tx, agent));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    LockRecord lock{.resource = prefix + "-res", .owner_agent_id = "a", .acquired_at_ms = 1, .expires_at_ms = 2};
    assert(repo.UpsertLock(*tx, lock));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetAgent(*tx, prefix + "-ghost").has_value());
  assert(!repo.GetLock(*tx, prefix + "-res").has_value());
  tx->Commit();
}

void VerifyReadOnlyTransactions(Repository& repo, const std::string& prefix, bool parallel) {
  {
    auto tx = repo.Begin();
    AgentRecord agent{.agent_id = prefix + "-reader", .registered_at_ms = 1, .last_heartbeat_ms = 1};
    assert(repo.UpsertAgent(*tx, agent));
    tx->Commit();
  }

  auto read = repo.Begin(TxMode::kReadOnly);
  assert(read->Mode() == TxMode::kReadOnly);
  assert(repo.GetAgent(*read, prefix + "-reader").has_value());

  bool rejected = false;
  try {
    EventRecord event{.timestamp_ms = 1, .agent_id = prefix + "-reader", .action = "heartbeat"};
    (void)repo.AppendEvent(*read, event);
  } catch (const std::logic_error&) {
    rejected = true;
  }
  assert(rejected);
  read->Commit();

  if (!parallel) {
    return;
  }

  // an open reader does not make a writer's commit fail, nor the other way round
  auto reader = repo.Begin(TxMode::kReadOnly);
  auto writer = repo.Begin();
  assert(!repo.GetLock(*reader, prefix + "-res").has_value());
  LockRecord lock{.resource = prefix + "-res", .owner_agent_id = "cymoril-code", .acquired_at_ms = 1, .expires_at_ms = 100};
  assert(repo.UpsertLock(*writer, lock));
  reader->Commit();
  writer->Commit();

  auto again = repo.Begin(TxMode::kReadOnly);
  assert(repo.GetLock(*again, prefix + "-res").has_value());
  again->Commit();
}

void VerifyConcurrentWriters(Repository& repo, const std::string& prefix, bool parallel) {
  if (!parallel) {
    return;
  }

  auto first  = repo.Begin();
  auto second = repo.Begin();

  LockRecord mine{.resource = prefix + "-contended", .owner_agent_id = "cymoril-code", .acquired_at_ms = 1, .expires_at_ms = 100};
  LockRecord theirs{.resource = prefix + "-contended", .owner_agent_id = "cymoril-test", .acquired_at_ms = 1, .expires_at_ms = 100};

  // both saw the resource free
  assert(!repo.GetLock(*first, mine.resource).has_value());
  assert(!repo.GetLock(*second, theirs.resource).has_value());
  assert(repo.UpsertLock(*first, mine));
  assert(repo.UpsertLock(*second, theirs));

  first->Commit();

  bool retryable = false;
  try {
    second->Commit();
  } catch (const coord::util::StoreError& e) {
    retryable = e.Busy();
  }
  assert(retryable);

  auto verify = repo.Begin();
  assert(repo.GetLock(*verify, mine.resource)->owner_agent_id == "cymoril-code");
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();

    AgentRecord agent{.agent_id = prefix + "-agent", .capabilities = {"code"}, .registered_at_ms = 7, .last_heartbeat_ms = 9};
    assert(repo->UpsertAgent(*tx, agent));

    LockRecord lock{.resource = prefix + "-res", .owner_agent_id = agent.agent_id, .acquired_at_ms = 7, .expires_at_ms = 9};
    assert(repo->UpsertLock(*tx, lock));

    EventRecord event{.timestamp_ms = 7, .agent_id = agent.agent_id, .action = "registered"};
    assert(repo->AppendEvent(*tx, event));

    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto a  = repo->GetAgent(*tx, prefix + "-agent");
  assert(a.has_value());
  assert(a->capabilities.size() == 1);
  assert(repo->GetLock(*tx, prefix + "-res").has_value());

  EventQuery query{.agent_id = prefix + "-agent"};
  assert(repo->CountEvents(*tx, query) == 1);

  // ids keep increasing across reopen
  EventRecord next{.timestamp_ms = 8, .agent_id = prefix + "-agent", .action = "heartbeat"};
  assert(repo->AppendEvent(*tx, next));
  assert(next.event_id > repo->ListEvents(*tx, query).back().event_id);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if COORD_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("coord_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<coord::db::sqlite::SqliteDB>(db_path);
    coord::db::sql::RunMigrations(*db, coord::db::sql::CoordinationSchema());
    return std::make_shared<coord::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyAgentReadWrite(*repo, backend.name + "-agents");
  VerifyLockReadWrite(*repo, backend.name + "-locks");
  VerifyMessageReadWrite(*repo, backend.name + "-messages");
  VerifyEventReadWrite(*repo, backend.name + "-events");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyReadOnlyTransactions(*repo, backend.name + "-readonly", backend.supports_parallel_transactions);
  VerifyConcurrentWriters(*repo, backend.name + "-concurrency", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if COORD_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "coord_integration_repository_parity: pass\n";
  return 0;
}
