#include "internal/audit/event.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using ito::audit::AuditEvent;
using ito::audit::AuditEventBuilder;
using ito::audit::EventContext;

EventContext TestContext() {
  EventContext ctx;
  ctx.set_session_id("test-session");
  return ctx;
}

AuditEvent TaskEvent(const std::string& id, const std::string& to) {
  auto event = AuditEventBuilder()
                   .Entity(ito::audit::entities::kTask)
                   .EntityId(id)
                   .Scope("test-change")
                   .Op(ito::audit::ops::kStatusChange)
                   .From("pending")
                   .To(to)
                   .Actor(ito::audit::actors::kCli)
                   .By("@test")
                   .Context(TestContext())
                   .Build();
  assert(event.has_value());
  return *event;
}

void TestSerializedFormUsesWireKeys() {
  auto json = ito::audit::SerializeEvent(TaskEvent("1.1", "done"));

  assert(json.find('\n') == std::string::npos);
  assert(json.find("\"v\":1") != std::string::npos);
  assert(json.find("\"entity_id\":\"1.1\"") != std::string::npos);
  assert(json.find("\"from\":\"pending\"") != std::string::npos);
  assert(json.find("\"to\":\"done\"") != std::string::npos);
  assert(json.find("\"session_id\":\"test-session\"") != std::string::npos);
  assert(json.find("from_state") == std::string::npos);
}

void TestRoundTripPreservesEveryField() {
  auto original = TaskEvent("2.3", "in-progress");
  (*original.mutable_meta()->mutable_struct_value()->mutable_fields())["reason"].set_string_value("because");
  original.mutable_ctx()->set_branch("feature-x");
  original.mutable_ctx()->set_commit("abcd1234");

  auto decoded = ito::audit::ParseEventLine(ito::audit::SerializeEvent(original));
  assert(ito::audit::SameEvent(original, decoded));
}

void TestOptionalFieldsStayAbsent() {
  auto event = AuditEventBuilder()
                   .Entity(ito::audit::entities::kChange)
                   .EntityId("ch-1")
                   .Op(ito::audit::ops::kCreate)
                   .Actor(ito::audit::actors::kCli)
                   .By("@test")
                   .Context(TestContext())
                   .Build();
  assert(event.has_value());

  auto json = ito::audit::SerializeEvent(*event);
  assert(json.find("\"scope\"") == std::string::npos);
  assert(json.find("\"from\"") == std::string::npos);
  assert(json.find("\"to\"") == std::string::npos);

  auto decoded = ito::audit::ParseEventLine(json);
  assert(!decoded.has_scope());
  assert(!ito::audit::FromValue(decoded).has_value());
  assert(!ito::audit::ToValue(decoded).has_value());
}

void TestTimestampFormatIsMillisecondUtc() {
  auto event = TaskEvent("1.1", "done");
  const auto& ts = event.ts();
  // YYYY-MM-DDTHH:MM:SS.mmmZ
  assert(ts.size() == 24);
  assert(ts[10] == 'T');
  assert(ts[19] == '.');
  assert(ts.back() == 'Z');
  assert(ito::util::ParseIso8601(ts).has_value());
}

void TestBuilderRejectsMissingRequiredFields() {
  assert(!AuditEventBuilder().Entity("task").EntityId("1").Op("create").Actor("cli").By("@x").Build().has_value());
  assert(!AuditEventBuilder().Entity("task").Op("create").Actor("cli").By("@x").Context(TestContext()).Build().has_value());
}

void TestUnknownKeysAreTolerated() {
  const std::string line =
      R"({"v":1,"ts":"2026-02-08T14:30:00.000Z","entity":"task","entity_id":"1.1","op":"create","actor":"cli",)"
      R"("by":"@test","ctx":{"session_id":"s","future_field":1},"extra":{"nested":true}})";

  auto event = ito::audit::ParseEventLine(line);
  assert(event.entity_id() == "1.1");
  assert(event.ctx().session_id() == "s");
}

void TestUnsupportedVersionIsDistinct() {
  const std::string line =
      R"({"v":2,"ts":"2026-02-08T14:30:00.000Z","entity":"task","entity_id":"1.1","op":"create","actor":"cli",)"
      R"("by":"@test","ctx":{"session_id":"s"}})";

  bool version_error = false;
  try {
    (void)ito::audit::ParseEventLine(line);
  } catch (const ito::util::SchemaVersionError& e) {
    version_error = true;
    assert(e.version() == 2);
  }
  assert(version_error);
}

void TestMalformedLinesThrowParseError() {
  const std::string missing_session =
      R"({"v":1,"ts":"2026-02-08T14:30:00.000Z","entity":"task","entity_id":"1.1","op":"create","actor":"cli",)"
      R"("by":"@test","ctx":{}})";

  for (const std::string& line : {std::string("{\"v\":1,\"ts\":\"2026-02"), std::string("not json"), std::string("[]"), missing_session}) {
    bool threw = false;
    try {
      (void)ito::audit::ParseEventLine(line);
    } catch (const ito::util::SchemaVersionError&) {
      assert(false && "malformed input must not be reported as a version mismatch");
    } catch (const ito::util::ParseError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestEntityKeyOrderingAndScope() {
  ito::audit::EntityKey unscoped{"task", "1.1", std::nullopt};
  ito::audit::EntityKey scoped{"task", "1.1", std::string("ch")};

  assert(unscoped != scoped);
  assert(unscoped < scoped);
  assert(scoped.ToString() == "task/1.1 (scope: ch)");
  assert(ito::audit::KeyOf(TaskEvent("1.1", "done")) == (ito::audit::EntityKey{"task", "1.1", std::string("test-change")}));
}

} // namespace

int main() {
  TestSerializedFormUsesWireKeys();
  TestRoundTripPreservesEveryField();
  TestOptionalFieldsStayAbsent();
  TestTimestampFormatIsMillisecondUtc();
  TestBuilderRejectsMissingRequiredFields();
  TestUnknownKeysAreTolerated();
  TestUnsupportedVersionIsDistinct();
  TestMalformedLinesThrowParseError();
  TestEntityKeyOrderingAndScope();

  std::cout << "ito_audit_unit_audit_event: pass\n";
  return 0;
}
