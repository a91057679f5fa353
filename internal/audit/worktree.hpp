#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/audit/event.hpp"
#include "internal/audit/paths.hpp"

namespace ito::audit {

struct WorktreeInfo {
  std::filesystem::path      path;
  std::optional<std::string> branch; // short name, "refs/heads/" stripped
  bool                       is_main{false};

  // Stable identifier used as the aggregation tie-break.
  std::string Id() const {
    return path.string();
  }

  // Branch name, "main" for a detached main worktree, else the directory name.
  std::string Label() const;
};

/*
  Parse `git worktree list --porcelain`.

  Bare entries are dropped. The first non-bare entry is the main worktree.
*/
std::vector<WorktreeInfo> ParseWorktreeList(std::string_view porcelain);

std::optional<std::filesystem::path> FindWorktreeForBranch(std::string_view porcelain, std::string_view branch);

/*
  Enumerate the worktrees of the repository containing project_root.

  When git is unavailable or project_root is not inside a repository the
  project root itself is returned as the single main worktree.
*/
std::vector<WorktreeInfo> DiscoverWorktrees(const std::filesystem::path& project_root);

struct WorktreeEvent {
  AuditEvent  event;
  std::string worktree_id;
  std::string label;
  std::size_t position{0}; // 0-based index in that worktree's log
};

struct ExcludedWorktree {
  WorktreeInfo worktree;
  std::string  reason;
};

struct AggregateResult {
  std::vector<WorktreeEvent>    events;
  std::vector<ExcludedWorktree> excluded;
  std::size_t                   skipped_lines{0};
};

/*
  Merge every worktree log into one timeline.

  Order: parsed ts, then worktree id, then physical position. Events with
  an unparseable ts sort first. Identical inputs always produce identical
  output. Worktrees without a readable log are reported in `excluded` and
  never fail the aggregate.
*/
AggregateResult AggregateWorktreeEvents(const std::vector<WorktreeInfo>& worktrees, const LogLayout& layout);

} // namespace ito::audit
