#include "paths.hpp"

#include "internal/config/config_defaults.hpp"

namespace ito::audit {

LogLayout LogLayout::FromConfig(const ito::runtime::config::AuditConfig& config) {
  LogLayout layout;
  layout.state_dir         = config.state_dir().empty() ? ito::config::kDefaultStateDir : config.state_dir();
  layout.log_relative_path = config.log_relative_path().empty() ? ito::config::kDefaultLogRelativePath : config.log_relative_path();
  return layout;
}

std::filesystem::path LogLayout::StateDir(const std::filesystem::path& worktree_root) const {
  return worktree_root / state_dir;
}

std::filesystem::path LogLayout::LogPath(const std::filesystem::path& worktree_root) const {
  return StateDir(worktree_root) / log_relative_path;
}

std::filesystem::path LogLayout::SessionFile(const std::filesystem::path& worktree_root) const {
  return LogPath(worktree_root).parent_path() / ".session";
}

} // namespace ito::audit
