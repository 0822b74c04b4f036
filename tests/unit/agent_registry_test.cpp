#include "internal/agents/agent_registry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/events/event_log.hpp"

namespace {

using coord::agents::AgentRegistry;
using coord::db::memory::MemoryRepository;
using coord::events::EventLog;
using coord::model::AgentStatus;

constexpr uint64_t kT0       = 1'700'000'000'000;
constexpr auto     kStaleTtl = std::chrono::minutes(3);

struct Fixture {
  std::shared_ptr<MemoryRepository> repo   = std::make_shared<MemoryRepository>();
  std::shared_ptr<EventLog>         events = std::make_shared<EventLog>(repo);
  AgentRegistry                     registry{repo, events, kStaleTtl};
};

void TestRegisterIsIdempotentAndKeepsRegisteredAt() {
  Fixture f;

  auto tx    = f.repo->Begin();
  auto first = f.registry.Register(*tx, kT0, "cymoril-code", {"code", "review", "code"});
  tx->Commit();

  assert(first.registered_at_ms == kT0);
  assert(first.capabilities.size() == 2);
  assert(first.status == AgentStatus::kActive);

  auto tx2    = f.repo->Begin();
  auto second = f.registry.Register(*tx2, kT0 + 5000, "cymoril-code", {"test"});
  tx2->Commit();

  assert(second.registered_at_ms == kT0);
  assert(second.last_heartbeat_ms == kT0 + 5000);
  assert(second.capabilities.size() == 1);
  assert(second.capabilities[0] == "test");

  auto read = f.repo->Begin();
  assert(f.registry.List(*read).size() == 1);

  coord::db::EventQuery query;
  query.action = coord::events::action::kRegistered;
  assert(f.events->Query(*read, query).total_count == 2);
}

void TestHeartbeatUpdatesTaskAndStatus() {
  Fixture f;

  auto tx = f.repo->Begin();
  f.registry.Register(*tx, kT0, "cymoril-code", {});
  auto agent = f.registry.Heartbeat(*tx, kT0 + 1000, "cymoril-code", std::string("refactor parser"), AgentStatus::kBusy);
  assert(agent.current_task.value() == "refactor parser");
  assert(agent.status == AgentStatus::kBusy);

  // omitted fields keep their values
  agent = f.registry.Heartbeat(*tx, kT0 + 2000, "cymoril-code", std::nullopt, std::nullopt);
  assert(agent.current_task.value() == "refactor parser");
  assert(agent.status == AgentStatus::kBusy);

  // empty task clears it
  agent = f.registry.Heartbeat(*tx, kT0 + 3000, "cymoril-code", std::string(""), AgentStatus::kIdle);
  assert(!agent.current_task.has_value());
  assert(agent.status == AgentStatus::kIdle);
  tx->Commit();
}

void TestHeartbeatNeverMovesBackwards() {
  Fixture f;

  auto tx = f.repo->Begin();
  f.registry.Heartbeat(*tx, kT0 + 10'000, "cymoril-code", std::nullopt, std::nullopt);
  auto agent = f.registry.Heartbeat(*tx, kT0, "cymoril-code", std::nullopt, std::nullopt);
  tx->Commit();

  assert(agent.last_heartbeat_ms == kT0 + 10'000);
}

void TestHeartbeatFromUnknownAgentCreatesIt() {
  Fixture f;

  auto tx    = f.repo->Begin();
  auto agent = f.registry.Heartbeat(*tx, kT0, "cymoril-docs", std::nullopt, std::nullopt);
  tx->Commit();

  assert(agent.registered_at_ms == kT0);
  assert(agent.capabilities.empty());

  auto read = f.repo->Begin();
  assert(f.registry.List(*read).size() == 1);
}

void TestStalenessBoundary() {
  Fixture f;

  auto tx    = f.repo->Begin();
  auto agent = f.registry.Register(*tx, kT0, "cymoril-code", {});
  f.registry.Register(*tx, kT0 + 60'000, "cymoril-test", {});
  tx->Commit();

  const uint64_t ttl = std::chrono::duration_cast<std::chrono::milliseconds>(kStaleTtl).count();

  assert(!f.registry.IsStale(agent, kT0 + ttl));
  assert(f.registry.IsStale(agent, kT0 + ttl + 1));
  assert(f.registry.EffectiveStatus(agent, kT0 + ttl + 1) == AgentStatus::kStale);
  assert(f.registry.EffectiveStatus(agent, kT0 + ttl) == AgentStatus::kActive);

  auto read  = f.repo->Begin();
  auto stale = f.registry.StaleAgents(*read, kT0 + ttl + 1);
  assert(stale.size() == 1);
  assert(stale[0] == "cymoril-code");
}

} // namespace

int main() {
  TestRegisterIsIdempotentAndKeepsRegisteredAt();
  TestHeartbeatUpdatesTaskAndStatus();
  TestHeartbeatNeverMovesBackwards();
  TestHeartbeatFromUnknownAgentCreatesIt();
  TestStalenessBoundary();

  std::cout << "coord_unit_agent_registry: pass\n";
  return 0;
}
