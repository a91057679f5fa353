#pragma once

#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace ito::audit {

/*
  Where a worktree keeps its audit state.

      <root>/<state_dir>/<log_relative_path>      e.g. .ito/.state/audit/events.jsonl
      <log dir>/.session                          per-checkout session id
*/
struct LogLayout {
  std::string           state_dir{".ito"};
  std::filesystem::path log_relative_path{".state/audit/events.jsonl"};

  static LogLayout FromConfig(const ito::runtime::config::AuditConfig& config);

  std::filesystem::path StateDir(const std::filesystem::path& worktree_root) const;
  std::filesystem::path LogPath(const std::filesystem::path& worktree_root) const;
  std::filesystem::path SessionFile(const std::filesystem::path& worktree_root) const;
};

} // namespace ito::audit
