#include "worktree.hpp"

#include <algorithm>
#include <tuple>

#include "internal/audit/reader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace ito::audit {

using ito::observability::IntField;
using ito::observability::StringField;

namespace {

constexpr std::string_view kWorktreePrefix = "worktree ";
constexpr std::string_view kBranchPrefix   = "branch ";
constexpr std::string_view kHeadsPrefix    = "refs/heads/";

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Throws util::DiscoveryError when the worktree contributes nothing.
ReadResult ReadWorktreeLog(const WorktreeInfo& worktree, const LogLayout& layout) {
  auto log_path = layout.LogPath(worktree.path);

  ReadResult result;
  try {
    result = ReadAll(log_path);
  } catch (const util::IoError& ex) {
    throw util::DiscoveryError(std::string("unreadable audit log: ") + ex.what());
  }
  if (result.file_missing) {
    throw util::DiscoveryError("no audit log at " + log_path.string());
  }
  return result;
}

} // namespace

std::string WorktreeInfo::Label() const {
  if (branch && !branch->empty()) return *branch;
  if (is_main) return "main";
  return path.filename().string();
}

std::vector<WorktreeInfo> ParseWorktreeList(std::string_view porcelain) {
  std::vector<WorktreeInfo> worktrees;

  std::optional<WorktreeInfo> current;
  bool                        bare = false;

  auto flush = [&]() {
    if (current && !bare) {
      current->is_main = worktrees.empty();
      worktrees.push_back(std::move(*current));
    }
    current.reset();
    bare = false;
  };

  std::size_t pos = 0;
  while (pos <= porcelain.size()) {
    auto end = porcelain.find('\n', pos);
    if (end == std::string_view::npos) end = porcelain.size();
    auto line = porcelain.substr(pos, end - pos);
    pos       = end + 1;

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    if (StartsWith(line, kWorktreePrefix)) {
      flush();
      current       = WorktreeInfo{};
      current->path = std::string(line.substr(kWorktreePrefix.size()));
    } else if (StartsWith(line, kBranchPrefix)) {
      if (!current) continue;
      auto ref = line.substr(kBranchPrefix.size());
      if (StartsWith(ref, kHeadsPrefix)) {
        current->branch = std::string(ref.substr(kHeadsPrefix.size()));
      }
    } else if (line == "bare") {
      bare = true;
    } else if (line.empty()) {
      flush();
    }
  }
  flush();

  return worktrees;
}

std::optional<std::filesystem::path> FindWorktreeForBranch(std::string_view porcelain, std::string_view branch) {
  for (const auto& wt : ParseWorktreeList(porcelain)) {
    if (wt.branch && *wt.branch == branch) return wt.path;
  }
  return std::nullopt;
}

std::vector<WorktreeInfo> DiscoverWorktrees(const std::filesystem::path& project_root) {
  auto result = util::RunCommand({"git", "-C", project_root.string(), "worktree", "list", "--porcelain"});

  if (result.spawned && result.exit_code == 0) {
    auto worktrees = ParseWorktreeList(result.stdout_text);
    if (!worktrees.empty()) {
      ITO_LOG_DEBUG("worktrees discovered", {IntField("count", static_cast<int64_t>(worktrees.size()))});
      return worktrees;
    }
  }

  ITO_LOG_WARN("git worktree discovery unavailable, using project root",
               {StringField("root", project_root.string()), IntField("exit_code", result.exit_code)});

  WorktreeInfo root;
  root.path    = project_root;
  root.is_main = true;
  return {root};
}

AggregateResult AggregateWorktreeEvents(const std::vector<WorktreeInfo>& worktrees, const LogLayout& layout) {
  AggregateResult aggregate;

  for (const auto& worktree : worktrees) {
    ReadResult read;
    try {
      read = ReadWorktreeLog(worktree, layout);
    } catch (const util::DiscoveryError& ex) {
      ITO_LOG_WARN("worktree excluded from aggregate", {StringField("worktree", worktree.Id()), StringField("reason", ex.what())});
      aggregate.excluded.push_back({worktree, ex.what()});
      continue;
    }

    aggregate.skipped_lines += read.skipped_lines();

    auto id    = worktree.Id();
    auto label = worktree.Label();
    for (std::size_t i = 0; i < read.events.size(); ++i) {
      aggregate.events.push_back({std::move(read.events[i]), id, label, i});
    }
  }

  // Parse once; the sort compares these keys.
  std::vector<std::pair<std::optional<util::TimePoint>, std::size_t>> keys;
  keys.reserve(aggregate.events.size());
  for (std::size_t i = 0; i < aggregate.events.size(); ++i) {
    keys.emplace_back(util::ParseIso8601(aggregate.events[i].event.ts()), i);
  }

  std::stable_sort(keys.begin(), keys.end(), [&](const auto& a, const auto& b) {
    const auto& ea = aggregate.events[a.second];
    const auto& eb = aggregate.events[b.second];
    return std::tie(a.first, ea.worktree_id, ea.position) < std::tie(b.first, eb.worktree_id, eb.position);
  });

  std::vector<WorktreeEvent> ordered;
  ordered.reserve(keys.size());
  for (const auto& key : keys) {
    ordered.push_back(std::move(aggregate.events[key.second]));
  }
  aggregate.events = std::move(ordered);

  return aggregate;
}

} // namespace ito::audit
