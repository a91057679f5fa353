#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/config/config_defaults.hpp"
#include "internal/factory.hpp"
#include "ito/audit/v1.hpp"

namespace {

using ito::audit::AuditEvent;
using ito::audit::EntityKey;

std::filesystem::path FreshDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / "ito_audit_end_to_end_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

AuditEvent StatusEvent(const std::string& id, std::optional<std::string> from, const std::string& to,
                       std::optional<std::string> scope = std::nullopt) {
  ito::audit::EventContext ctx;
  ctx.set_session_id("e2e");
  ito::audit::AuditEventBuilder builder;
  builder.Entity("task").EntityId(id).Op("status").To(to).Actor("cli").By("@test").Context(ctx);
  if (from) builder.From(*from);
  if (scope) builder.Scope(*scope);
  auto event = builder.Build();
  assert(event.has_value());
  return *event;
}

void TestAppendReadReconcile() {
  auto log = FreshDir("scenario") / "events.jsonl";

  ito::audit::FsAuditWriter writer(log);
  assert(writer.Append(StatusEvent("1.1", std::nullopt, "pending")));
  assert(writer.Append(StatusEvent("1.1", std::string("pending"), "done")));

  auto read = ito::audit::ReadAll(log);
  assert(read.events.size() == 2);
  assert(read.events[0].to_state() == "pending");
  assert(read.events[1].from_state() == "pending");
  assert(read.events[1].to_state() == "done");

  ito::audit::FileState files;
  files.values[EntityKey{"task", "1.1", std::nullopt}] = "done";
  assert(ito::audit::RunReconcile(read.events, files).Clean());
}

void TestProjectDriftIsFixedThroughTheWriterPort() {
  auto root = FreshDir("project");
  auto dir  = root / ".ito" / "changes" / "add-login";
  std::filesystem::create_directories(dir);
  {
    std::ofstream out(dir / "tasks.md");
    out << "## Wave 1\n\n### Task 1.1: Form\n- **Status**: [x] complete\n\n### Task 1.2: Session\n- **Status**: [ ] pending\n";
  }

  auto app = ito::factory::Build(ito::config::DefaultConfig(), root, ito::factory::AuditAccess::Write);
  assert(app.audit.enabled);

  // Start tailing before anything is written.
  ito::audit::StreamConfig stream_config;
  auto initial = ito::audit::ReadInitialEvents(app.audit.log_path, stream_config);
  assert(initial.events.empty());

  assert(app.audit.Record(StatusEvent("1.1", std::nullopt, "pending", std::string("add-login"))));

  auto read   = ito::audit::ReadAll(app.audit.log_path);
  auto files  = ito::audit::BuildFileState(app.state_sources);
  auto report = ito::audit::RunReconcile(read.events, files, app.reconcile_options);
  assert(report.drift.size() == 2);
  assert(report.drift[0].kind == ito::audit::DriftKind::Diverged);
  assert(report.drift[1].kind == ito::audit::DriftKind::Unlogged);

  for (const auto& fix : ito::audit::GenerateCompensatingEvents(report.drift, app.audit.event_context)) {
    assert(app.audit.Record(fix));
  }

  read = ito::audit::ReadAll(app.audit.log_path);
  assert(read.events.size() == 3);
  assert(ito::audit::RunReconcile(read.events, files, app.reconcile_options).Clean());
  assert(ito::audit::ValidateLog(app.audit.log_path).Valid());

  auto poll = ito::audit::PollNewEvents(app.audit.log_path, initial.cursor);
  assert(poll.events.size() == 3);
  assert(poll.events[1].event.op() == ito::audit::ops::kReconciled);
  assert(ito::audit::PollNewEvents(app.audit.log_path, poll.cursor).events.empty());

  auto stats = ito::audit::ComputeStats(read.events);
  assert(stats.by_actor.at("reconcile") == 2);
}

} // namespace

int main() {
  TestAppendReadReconcile();
  TestProjectDriftIsFixedThroughTheWriterPort();

  std::cout << "ito_audit_unit_end_to_end: pass\n";
  return 0;
}
