#include "internal/events/event_log.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using coord::db::EventQuery;
using coord::db::memory::MemoryRepository;
using coord::events::EventLog;
namespace action = coord::events::action;

void TestAppendAssignsIncreasingIds() {
  auto     repo = std::make_shared<MemoryRepository>();
  EventLog log(repo);

  auto tx = repo->Begin();
  auto a  = log.Append(*tx, 1000, "cymoril-code", action::kRegistered);
  auto b  = log.Append(*tx, 1000, "cymoril-code", action::kHeartbeat);
  tx->Commit();

  assert(a.event_id > 0);
  assert(b.event_id > a.event_id);
}

void TestQueryIsNewestFirstWithTotalCount() {
  auto     repo = std::make_shared<MemoryRepository>();
  EventLog log(repo);

  auto tx = repo->Begin();
  for (int i = 0; i < 5; ++i) {
    log.Append(*tx, 1000 + i, "cymoril-code", action::kHeartbeat);
  }
  log.Append(*tx, 2000, "cymoril-test", action::kLockAcquired, std::string("src/lib.rs"));
  tx->Commit();

  auto       read = repo->Begin();
  EventQuery query;
  query.limit = 3;
  auto page   = log.Query(*read, query);

  assert(page.events.size() == 3);
  assert(page.total_count == 6);
  assert(page.events[0].action == action::kLockAcquired);
  assert(page.events[0].resource.value() == "src/lib.rs");
  assert(page.events[0].event_id > page.events[1].event_id);
  assert(page.events[1].event_id > page.events[2].event_id);
}

void TestFiltersCombine() {
  auto     repo = std::make_shared<MemoryRepository>();
  EventLog log(repo);

  auto tx = repo->Begin();
  log.Append(*tx, 1, "cymoril-code", action::kLockAcquired, std::string("a"));
  log.Append(*tx, 2, "cymoril-code", action::kHeartbeat);
  log.Append(*tx, 3, "cymoril-test", action::kLockAcquired, std::string("b"));
  tx->Commit();

  auto       read = repo->Begin();
  EventQuery query;
  query.agent_id = "cymoril-code";
  query.action   = action::kLockAcquired;
  auto page      = log.Query(*read, query);

  assert(page.total_count == 1);
  assert(page.events.size() == 1);
  assert(page.events[0].resource.value() == "a");
}

void TestDetailSurvivesEncoding() {
  auto     repo = std::make_shared<MemoryRepository>();
  EventLog log(repo);

  google::protobuf::Struct detail;
  (*detail.mutable_fields())["holder"].set_string_value("cymoril-code");
  (*detail.mutable_fields())["remaining_ms"].set_number_value(1500);

  auto tx = repo->Begin();
  log.Append(*tx, 1, "cymoril-test", action::kLockDenied, std::string("src/lib.rs"), std::nullopt, &detail);
  tx->Commit();

  auto read  = repo->Begin();
  auto page  = log.Query(*read, EventQuery{});
  auto again = coord::events::DecodeDetail(page.events[0].detail_json);
  assert(again.fields().at("holder").string_value() == "cymoril-code");
  assert(again.fields().at("remaining_ms").number_value() == 1500);

  // empty detail is stored as nothing
  assert(coord::events::EncodeDetail(google::protobuf::Struct{}).empty());
}

void TestRolledBackEventsDisappear() {
  auto     repo = std::make_shared<MemoryRepository>();
  EventLog log(repo);

  {
    auto tx = repo->Begin();
    log.Append(*tx, 1, "cymoril-code", action::kRegistered);
    // destroyed without commit
  }

  auto read = repo->Begin();
  assert(log.Query(*read, EventQuery{}).total_count == 0);
}

} // namespace

int main() {
  TestAppendAssignsIncreasingIds();
  TestQueryIsNewestFirstWithTotalCount();
  TestFiltersCombine();
  TestDetailSurvivesEncoding();
  TestRolledBackEventsDisappear();

  std::cout << "coord_unit_event_log: pass\n";
  return 0;
}
