#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/coordinator.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using coord::core::Coordinator;
using coord::core::CoordinatorOptions;
using coord::db::sqlite::SqliteDB;
using coord::db::sqlite::SqliteRepository;

// Each handle is its own sqlite connection, the same as a separate process.
std::shared_ptr<SqliteRepository> OpenHandle(const std::string& path, int busy_timeout_ms = 5000) {
  auto db = std::make_shared<SqliteDB>(path, busy_timeout_ms);
  coord::db::sql::RunMigrations(*db, coord::db::sql::CoordinationSchema());
  return std::make_shared<SqliteRepository>(std::move(db));
}

coord::v1::LockRequest LockReq(const std::string& agent_id, const std::string& resource) {
  coord::v1::LockRequest req;
  req.set_agent_id(agent_id);
  req.set_resource(resource);
  return req;
}

void TestSecondHandleSeesCommittedLock(const std::string& path) {
  Coordinator first(OpenHandle(path), CoordinatorOptions{});
  Coordinator second(OpenHandle(path), CoordinatorOptions{});

  assert(first.Lock(LockReq("cymoril-code", "src/parser.rs")).granted());

  bool conflicted = false;
  try {
    second.Lock(LockReq("cymoril-test", "src/parser.rs"));
  } catch (const coord::util::LockConflict& e) {
    conflicted = true;
    assert(e.Holder().owner_agent_id == "cymoril-code");
  }
  assert(conflicted);

  // the denial written through the second handle is visible to the first
  coord::v1::LogRequest denied;
  denied.set_action("lock_denied");
  assert(first.Log(denied).total_count() == 1);
}

void TestHeldWriteLockReportsBusy(const std::string& path) {
  auto holder  = OpenHandle(path);
  auto waiting = OpenHandle(path, 50);

  auto tx = holder->Begin();

  bool busy = false;
  try {
    auto blocked = waiting->Begin();
  } catch (const coord::util::StoreError& e) {
    busy = e.Busy();
  }
  assert(busy);

  tx->Rollback();

  // free again
  auto retry = waiting->Begin();
  retry->Commit();
}

void TestRacingHandlesGrantOnce(const std::string& path) {
  constexpr int kHandles = 6;

  std::atomic<int> granted{0};
  std::atomic<int> denied{0};
  std::atomic<int> failed{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kHandles; ++i) {
    threads.emplace_back([&, i] {
      try {
        Coordinator coordinator(OpenHandle(path), CoordinatorOptions{});
        coordinator.Lock(LockReq("agent-" + std::to_string(i), "Cargo.lock"));
        granted++;
      } catch (const coord::util::LockConflict&) {
        denied++;
      } catch (const std::exception& e) {
        std::cerr << "unexpected: " << e.what() << "\n";
        failed++;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(failed == 0);
  assert(granted == 1);
  assert(denied == kHandles - 1);
}

// coordd serves every worker thread from one cached handle per project.
void TestThreadsShareOneHandle(const std::string& path) {
  constexpr int kThreads = 8;
  constexpr int kCalls   = 50;

  std::filesystem::remove(path);
  Coordinator coordinator(OpenHandle(path), CoordinatorOptions{});

  std::atomic<int> granted{0};
  std::atomic<int> failed{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      const auto agent = "worker-" + std::to_string(i);
      for (int n = 0; n < kCalls; ++n) {
        try {
          if (coordinator.Lock(LockReq(agent, agent + "/file-" + std::to_string(n))).granted()) granted++;
          // readers interleave with the writers on the same connection
          coord::v1::LogRequest recent;
          recent.set_agent_id(agent);
          recent.set_limit(1);
          coordinator.Log(recent);
        } catch (const std::exception& e) {
          std::cerr << "unexpected: " << e.what() << "\n";
          failed++;
        }
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(failed == 0);
  assert(granted == kThreads * kCalls);

  coord::v1::LogRequest acquired;
  acquired.set_action("lock_acquired");
  acquired.set_limit(1);
  assert(coordinator.Log(acquired).total_count() == kThreads * kCalls);
}

} // namespace

int main() {
  const auto path =
      (std::filesystem::temp_directory_path() / ("coord_contention_" + std::to_string(coord::util::ToUnixMillis(coord::util::Now())) + ".db")).string();

  TestSecondHandleSeesCommittedLock(path);
  TestHeldWriteLockReportsBusy(path);
  TestRacingHandlesGrantOnce(path);
  TestThreadsShareOneHandle(path + "-shared");

  for (const auto& db : {path, path + "-shared"}) {
    std::filesystem::remove(db);
    std::filesystem::remove(db + "-wal");
    std::filesystem::remove(db + "-shm");
  }

  std::cout << "coord_integration_sqlite_contention: pass\n";
  return 0;
}
