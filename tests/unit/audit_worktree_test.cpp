#include "internal/audit/worktree.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/audit/fs_writer.hpp"

namespace {

using ito::audit::AuditEvent;
using ito::audit::LogLayout;
using ito::audit::WorktreeInfo;

std::filesystem::path FreshDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / "ito_audit_worktree_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

AuditEvent MakeEvent(const std::string& entity_id, const std::string& ts) {
  ito::audit::EventContext ctx;
  ctx.set_session_id("worktree-test");
  auto event = ito::audit::AuditEventBuilder()
                   .Entity("task")
                   .EntityId(entity_id)
                   .Op("create")
                   .To("pending")
                   .Actor("cli")
                   .By("@test")
                   .Context(ctx)
                   .At(*ito::util::ParseIso8601(ts))
                   .Build();
  assert(event.has_value());
  return *event;
}

WorktreeInfo Worktree(const std::filesystem::path& path, const std::string& branch, bool is_main) {
  WorktreeInfo wt;
  wt.path    = path;
  wt.branch  = branch;
  wt.is_main = is_main;
  return wt;
}

void TestParseSingleWorktree() {
  auto wts = ito::audit::ParseWorktreeList("worktree /home/user/project\nHEAD abc1234\nbranch refs/heads/main\n\n");
  assert(wts.size() == 1);
  assert(wts[0].path == "/home/user/project");
  assert(wts[0].branch && *wts[0].branch == "main");
  assert(wts[0].is_main);
}

void TestParseSkipsBareAndHandlesDetached() {
  const std::string porcelain =
      "worktree /srv/repo.git\n"
      "bare\n"
      "\n"
      "worktree /srv/main\n"
      "HEAD abc1234\n"
      "branch refs/heads/main\n"
      "\n"
      "worktree /srv/wt-feature\n"
      "HEAD def5678\n"
      "branch refs/heads/feature-x\n"
      "\n"
      "worktree /srv/wt-detached\n"
      "HEAD 0123456\n"
      "detached";

  auto wts = ito::audit::ParseWorktreeList(porcelain);
  assert(wts.size() == 3);
  assert(wts[0].path == "/srv/main" && wts[0].is_main);
  assert(!wts[1].is_main && *wts[1].branch == "feature-x");
  assert(!wts[2].branch.has_value());
  assert(wts[2].Label() == "wt-detached");
  assert(wts[1].Label() == "feature-x");
}

void TestFindWorktreeForBranch() {
  const std::string porcelain =
      "worktree /srv/main\nbranch refs/heads/main\n\n"
      "worktree /srv/wt-a\nbranch refs/heads/feature-a\n\n"
      "worktree /srv/bare\nbare\nbranch refs/heads/feature-b\n\n";

  auto found = ito::audit::FindWorktreeForBranch(porcelain, "feature-a");
  assert(found && *found == "/srv/wt-a");
  assert(!ito::audit::FindWorktreeForBranch(porcelain, "feature-b"));
  assert(!ito::audit::FindWorktreeForBranch(porcelain, "nope"));
  assert(!ito::audit::FindWorktreeForBranch("", "main"));
}

void TestAggregateOrdersByTimestampThenWorktreeThenPosition() {
  auto      base = FreshDir("aggregate");
  LogLayout layout;

  auto wt_a = Worktree(base / "a", "main", true);
  auto wt_b = Worktree(base / "b", "feature", false);

  ito::audit::FsAuditWriter a(layout.LogPath(wt_a.path));
  ito::audit::FsAuditWriter b(layout.LogPath(wt_b.path));

  // b is written first so file discovery order cannot explain the result
  assert(b.Append(MakeEvent("b1", "2026-02-08T10:00:00.000Z")));
  assert(b.Append(MakeEvent("b2", "2026-02-08T10:00:00.000Z")));
  assert(a.Append(MakeEvent("a1", "2026-02-08T10:00:00.000Z")));
  assert(a.Append(MakeEvent("a0", "2026-02-08T09:00:00.000Z")));

  auto first  = ito::audit::AggregateWorktreeEvents({wt_b, wt_a}, layout);
  auto second = ito::audit::AggregateWorktreeEvents({wt_a, wt_b}, layout);

  std::vector<std::string> expected{"a0", "a1", "b1", "b2"};
  assert(first.events.size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    assert(first.events[i].event.entity_id() == expected[i]);
    assert(second.events[i].event.entity_id() == expected[i]);
  }
  assert(first.events[0].label == "main");
  assert(first.events[2].label == "feature");
  assert(first.excluded.empty());
}

void TestMissingLogIsExcludedNotFatal() {
  auto      base = FreshDir("excluded");
  LogLayout layout;

  auto present = Worktree(base / "present", "main", true);
  auto absent  = Worktree(base / "absent", "gone", false);

  ito::audit::FsAuditWriter writer(layout.LogPath(present.path));
  assert(writer.Append(MakeEvent("1.1", "2026-02-08T10:00:00.000Z")));

  auto aggregate = ito::audit::AggregateWorktreeEvents({present, absent}, layout);
  assert(aggregate.events.size() == 1);
  assert(aggregate.excluded.size() == 1);
  assert(aggregate.excluded[0].worktree.path == absent.path);
  assert(!aggregate.excluded[0].reason.empty());
}

void TestDiscoveryFallsBackToProjectRoot() {
  auto root = FreshDir("not_a_repo");
  auto wts  = ito::audit::DiscoverWorktrees(root);
  assert(wts.size() == 1);
  assert(wts[0].path == root);
  assert(wts[0].is_main);
  assert(wts[0].Label() == "main");
}

} // namespace

int main() {
  TestParseSingleWorktree();
  TestParseSkipsBareAndHandlesDetached();
  TestFindWorktreeForBranch();
  TestAggregateOrdersByTimestampThenWorktreeThenPosition();
  TestMissingLogIsExcludedNotFatal();
  TestDiscoveryFallsBackToProjectRoot();

  std::cout << "ito_audit_unit_audit_worktree: pass\n";
  return 0;
}
