#include "internal/tools/tool_dispatcher.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/util/time.hpp"

namespace {

using google::protobuf::Struct;

struct Harness {
  std::shared_ptr<coord::util::ManualTimeSource> clock;
  coord::factory::Application                    app;
};

Harness MakeHarness() {
  ::unsetenv("COORD_PROJECT");
  ::unsetenv("COORD_PROJECT_ROOT");

  auto root = std::filesystem::temp_directory_path() / "coord_tool_dispatcher_tests" / "cymoril";
  std::filesystem::create_directories(root);

  coord::runtime::config::RuntimeConfig config;
  config.mutable_store()->mutable_memory();
  config.mutable_projects()->set_default_project("cymoril");
  auto* entry = config.mutable_projects()->add_entries();
  entry->set_id("cymoril");
  entry->set_root(root.string());

  Harness h;
  h.clock = std::make_shared<coord::util::ManualTimeSource>(coord::util::FromUnixMillis(1'700'000'000'000));
  h.app   = coord::factory::Build(config, h.clock);
  return h;
}

Struct Parse(const std::string& json) {
  Struct out;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &out);
  assert(status.ok());
  return out;
}

const google::protobuf::Value& Field(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  assert(it != s.fields().end());
  return it->second;
}

std::string ErrorCode(const coord::tools::ToolResult& result) {
  assert(!result.ok);
  return Field(Parse(result.json), "error").string_value();
}

void TestRegisterAndLockRoundTrip() {
  auto  h     = MakeHarness();
  auto& tools = *h.app.tools;

  auto reg = tools.Call("coord_register", R"({"agent_id":"cymoril-code","capabilities":["code","review"]})");
  assert(reg.ok);
  auto reg_body = Parse(reg.json);
  assert(Field(reg_body, "agent_id").string_value() == "cymoril-code");
  assert(Field(reg_body, "capabilities").list_value().values_size() == 2);

  auto lock = tools.Call("coord_lock", R"({"agent_id":"cymoril-code","resource":"src/parser.rs","reason":"refactor"})");
  assert(lock.ok);
  auto lock_body = Parse(lock.json);
  assert(Field(lock_body, "granted").bool_value());
  assert(Field(lock_body, "owner_agent_id").string_value() == "cymoril-code");
  assert(!Field(lock_body, "refreshed").bool_value());

  auto conflict = tools.Call("coord_lock", R"({"agent_id":"cymoril-test","resource":"src/parser.rs"})");
  assert(ErrorCode(conflict) == "LOCK_CONFLICT");
  auto details = Field(Parse(conflict.json), "details").struct_value();
  assert(Field(details, "holder").string_value() == "cymoril-code");
  assert(Field(details, "remaining_ms").number_value() == 600000);

  auto not_owner = tools.Call("coord_unlock", R"({"agent_id":"cymoril-test","resource":"src/parser.rs"})");
  assert(ErrorCode(not_owner) == "UNLOCK_NOT_OWNER");

  // a resource nobody holds unlocks cleanly
  auto free_unlock = Parse(tools.Call("coord_unlock", R"({"agent_id":"cymoril-test","resource":"docs/README.md"})").json);
  assert(Field(free_unlock, "released").bool_value());
  assert(free_unlock.fields().count("was_held_by") == 0);
}

void TestArgumentErrors() {
  auto  h     = MakeHarness();
  auto& tools = *h.app.tools;

  auto missing = tools.Call("coord_register", R"({"capabilities":[]})");
  assert(ErrorCode(missing) == "AGENT_REQUIRED_FIELD_MISSING");
  assert(Field(Field(Parse(missing.json), "details").struct_value(), "field").string_value() == "agent_id");

  assert(ErrorCode(tools.Call("coord_register", R"({"agent_id":"a","colour":"blue"})")) == "INVALID_ARGUMENT");
  assert(ErrorCode(tools.Call("coord_register", "{not json")) == "INVALID_ARGUMENT");
  assert(ErrorCode(tools.Call("coord_heartbeat", R"({"agent_id":"a","status":"stale"})")) == "INVALID_ARGUMENT");
  assert(ErrorCode(tools.Call("coord_send", R"({"to":"b","from":"a","intent":"x"})")) == "AGENT_REQUIRED_FIELD_MISSING");
  assert(ErrorCode(tools.Call("coord_send", R"({"to":"b","from":"a","intent":"x","payload":{},"ttl_ms":-5})")) == "INVALID_ARGUMENT");
  assert(ErrorCode(tools.Call("coord_send", R"({"to":"b","from":"a","intent":"x","payload":{},"ttl_ms":"1000000000000000"})")) ==
         "INVALID_ARGUMENT");
  // b's inbox still renders after the rejected send
  auto inbox_b = tools.Call("coord_inbox", R"({"agent_id":"b"})");
  assert(inbox_b.ok);
  assert(Field(Parse(inbox_b.json), "messages").list_value().values_size() == 0);
  assert(ErrorCode(tools.Call("coord_ack", R"({"message_id":"nope","agent_id":"a"})")) == "MESSAGE_NOT_FOUND");
  assert(ErrorCode(tools.Call("coord_status", R"({"project_id":"elsewhere"})")) == "PROJECT_NOT_FOUND");

  auto unknown = tools.Call("coord_teleport", "{}");
  assert(ErrorCode(unknown) == "UNKNOWN_TOOL");
  assert(Field(Field(Parse(unknown.json), "details").struct_value(), "available").list_value().values_size() == 10);
}

void TestFacadeRoutesActions() {
  auto  h     = MakeHarness();
  auto& tools = *h.app.tools;

  assert(tools.Call("coordinator", R"({"action":"register","agent_id":"cymoril-code"})").ok);
  assert(tools.Call("coordinator", R"({"action":"lock","agent_id":"cymoril-code","resource":"Cargo.toml"})").ok);

  auto status = tools.Call("coordinator", R"({"action":"status"})");
  assert(status.ok);
  auto body = Parse(status.json);
  assert(Field(body, "locks").list_value().values_size() == 1);
  assert(Field(body, "agents").list_value().values_size() == 1);

  assert(ErrorCode(tools.Call("coordinator", R"({"agent_id":"cymoril-code"})")) == "AGENT_REQUIRED_FIELD_MISSING");
  assert(ErrorCode(tools.Call("coordinator", R"({"action":"dance"})")) == "UNKNOWN_TOOL");
}

void TestMessagingThroughTools() {
  auto  h     = MakeHarness();
  auto& tools = *h.app.tools;

  auto sent = tools.Call("coord_send", R"({"to":"cymoril-test","from":"cymoril-code","intent":"run_tests","payload":{"suite":"parser"}})");
  assert(sent.ok);
  const auto message_id = Field(Parse(sent.json), "message_id").string_value();
  assert(!message_id.empty());

  auto inbox = tools.Call("coord_inbox", R"({"agent_id":"cymoril-test"})");
  assert(inbox.ok);
  const auto  inbox_body = Parse(inbox.json);
  const auto& messages   = Field(inbox_body, "messages").list_value();
  assert(messages.values_size() == 1);
  const auto& message = messages.values(0).struct_value();
  assert(Field(message, "intent").string_value() == "run_tests");
  assert(Field(Field(message, "payload").struct_value(), "suite").string_value() == "parser");

  auto wrong = tools.Call("coord_ack", R"({"message_id":")" + message_id + R"(","agent_id":"cymoril-docs"})");
  assert(ErrorCode(wrong) == "MESSAGE_WRONG_RECIPIENT");

  auto ack = tools.Call("coord_ack", R"({"message_id":")" + message_id + R"(","agent_id":"cymoril-test","result":{"passed":true}})");
  assert(ack.ok);
  assert(Field(Parse(ack.json), "status").string_value() == "completed");
}

void TestHandleLineAndCatalog() {
  auto  h     = MakeHarness();
  auto& tools = *h.app.tools;

  auto line = tools.HandleLine(R"({"tool":"coord_register","arguments":{"agent_id":"cymoril-code"}})");
  assert(Field(Parse(line), "agent_id").string_value() == "cymoril-code");
  assert(line.find('\n') == std::string::npos);

  auto bad = Parse(tools.HandleLine(R"({"arguments":{}})"));
  assert(Field(bad, "error").string_value() == "AGENT_REQUIRED_FIELD_MISSING");

  auto garbage = Parse(tools.HandleLine("]["));
  assert(Field(garbage, "error").string_value() == "INVALID_ARGUMENT");

  auto catalog = Parse(coord::tools::ToolDispatcher::CatalogJson());
  assert(Field(catalog, "tools").list_value().values_size() == 9);
}

void TestLeaseExpiryThroughTools() {
  auto  h     = MakeHarness();
  auto& tools = *h.app.tools;

  assert(tools.Call("coord_lock", R"({"agent_id":"cymoril-code","resource":"db/schema.sql"})").ok);
  h.clock->Advance(std::chrono::minutes(10));

  auto taken = tools.Call("coord_lock", R"({"agent_id":"cymoril-test","resource":"db/schema.sql"})");
  assert(taken.ok);
  assert(Field(Parse(taken.json), "owner_agent_id").string_value() == "cymoril-test");
}

} // namespace

int main() {
  TestRegisterAndLockRoundTrip();
  TestArgumentErrors();
  TestFacadeRoutesActions();
  TestMessagingThroughTools();
  TestHandleLineAndCatalog();
  TestLeaseExpiryThroughTools();

  std::cout << "coord_unit_tool_dispatcher: pass\n";
  return 0;
}
