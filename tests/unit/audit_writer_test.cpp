#include "internal/audit/fs_writer.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/audit/reader.hpp"
#include "internal/audit/writer.hpp"
#include "internal/storage/log_file.hpp"

namespace {

using ito::audit::AuditEvent;
using ito::audit::FsAuditWriter;
using ito::util::ErrorCode;

std::filesystem::path FreshDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / "ito_audit_writer_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

AuditEvent MakeEvent(const std::string& entity_id, const std::string& to) {
  ito::audit::EventContext ctx;
  ctx.set_session_id("writer-test");
  auto event = ito::audit::AuditEventBuilder()
                   .Entity("task")
                   .EntityId(entity_id)
                   .Scope("ch")
                   .Op("status_change")
                   .To(to)
                   .Actor("cli")
                   .By("@test")
                   .Context(ctx)
                   .Build();
  assert(event.has_value());
  return *event;
}

std::size_t CountLines(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::string   line;
  std::size_t   n = 0;
  while (std::getline(in, line)) ++n;
  return n;
}

void TestAppendThenReadReturnsEventsInOrder() {
  auto dir = FreshDir("round_trip");
  auto log = dir / ".ito/.state/audit/events.jsonl";

  FsAuditWriter writer(log);
  std::vector<AuditEvent> written;
  for (int i = 0; i < 5; ++i) {
    written.push_back(MakeEvent("1." + std::to_string(i), i % 2 ? "done" : "pending"));
    assert(writer.Append(written.back()));
  }

  auto read = ito::audit::ReadAll(log);
  assert(!read.file_missing);
  assert(read.skipped_lines() == 0);
  assert(read.events.size() == written.size());
  for (std::size_t i = 0; i < written.size(); ++i) {
    assert(ito::audit::SameEvent(read.events[i], written[i]));
  }
}

void TestEveryLineIsNewlineTerminated() {
  auto dir = FreshDir("newline");
  auto log = dir / "events.jsonl";

  FsAuditWriter writer(log);
  assert(writer.Append(MakeEvent("1.1", "pending")));
  assert(writer.Append(MakeEvent("1.2", "pending")));

  auto contents = ito::storage::ReadAll(log);
  assert(!contents.empty() && contents.back() == '\n');
  assert(CountLines(log) == 2);
}

void TestExistingLinesAreNeverRewritten() {
  auto dir = FreshDir("append_only");
  auto log = dir / "events.jsonl";

  const std::string existing = "{\"legacy\":true}\n";
  {
    std::ofstream out(log);
    out << existing;
  }

  FsAuditWriter writer(log);
  assert(writer.Append(MakeEvent("1.1", "pending")));

  auto contents = ito::storage::ReadAll(log);
  assert(contents.compare(0, existing.size(), existing) == 0);
  assert(CountLines(log) == 2);
}

void TestTwoWritersOnOneFileDoNotCorruptIt() {
  auto dir = FreshDir("two_writers");
  auto log = dir / "events.jsonl";

  FsAuditWriter a(log);
  FsAuditWriter b(log);
  for (int i = 0; i < 10; ++i) {
    assert((i % 2 ? a : b).Append(MakeEvent("2." + std::to_string(i), "pending")));
  }

  auto read = ito::audit::ReadAll(log);
  assert(read.events.size() == 10);
  assert(read.malformed_lines == 0);
  assert(read.events[3].entity_id() == "2.3");
}

void TestInvalidEventIsRejectedWithoutWriting() {
  auto dir = FreshDir("invalid");
  auto log = dir / "events.jsonl";

  FsAuditWriter writer(log);
  auto          event = MakeEvent("1.1", "pending");
  event.mutable_ctx()->clear_session_id();

  auto result = writer.Append(event);
  assert(!result);
  assert(result.code == ErrorCode::InvalidEvent);
  assert(!std::filesystem::exists(log));

  auto wrong_version = MakeEvent("1.1", "pending");
  wrong_version.set_v(7);
  assert(writer.Append(wrong_version).code == ErrorCode::InvalidEvent);
}

void TestIoFailureIsReported() {
  auto dir     = FreshDir("io_failure");
  auto blocker = dir / "not-a-dir";
  {
    std::ofstream out(blocker);
    out << "x";
  }

  FsAuditWriter writer(blocker / "events.jsonl");
  auto          result = writer.Append(MakeEvent("1.1", "pending"));
  assert(!result);
  assert(result.code == ErrorCode::IOError);
  assert(!result.message.empty());

  bool threw = false;
  try {
    ito::util::ThrowIfError(result, "append");
  } catch (const ito::util::IoError&) {
    threw = true;
  }
  assert(threw);
}

void TestNoopWriterAcceptsEverything() {
  ito::audit::NoopAuditWriter noop;
  assert(noop.Append(MakeEvent("1.1", "pending")));
  assert(noop.Append(AuditEvent{}));
}

} // namespace

int main() {
  TestAppendThenReadReturnsEventsInOrder();
  TestEveryLineIsNewlineTerminated();
  TestExistingLinesAreNeverRewritten();
  TestTwoWritersOnOneFileDoNotCorruptIt();
  TestInvalidEventIsRejectedWithoutWriting();
  TestIoFailureIsReported();
  TestNoopWriterAcceptsEverything();

  std::cout << "ito_audit_unit_audit_writer: pass\n";
  return 0;
}
