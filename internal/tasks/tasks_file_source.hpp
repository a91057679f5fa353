#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/audit/reconcile.hpp"

namespace ito::tasks {

struct TaskEntry {
  std::string id;
  std::string status; // pending | in-progress | complete | shelved
};

/*
  Parse a change's tasks.md.

  Enhanced format:
      ### Task 1.1: Title
      - **Status**: [x] complete

  Otherwise checkbox lists ("- [ ] 1.1: Title", "- [x] Title"), where
  unlabelled items are numbered 1..N. A task without a recognised status
  is pending.
*/
std::vector<TaskEntry> ParseTasksFile(std::string_view contents);

/*
  File-state collaborator for task status.

  Reads <state_dir>/changes/<change>/tasks.md for every change (or only
  `change` when given). Changes under changes/archive/ are not scanned and
  their scopes are excluded from orphan detection.
*/
class TasksFileSource final : public audit::EntityStateSource {
 public:
  explicit TasksFileSource(std::filesystem::path state_dir, std::optional<std::string> change = std::nullopt);

  std::string Name() const override {
    return "tasks";
  }

  void Collect(audit::FileState* state) const override;

 private:
  void CollectChange(const std::string& change, audit::FileState* state) const;

  std::filesystem::path      changes_dir_;
  std::optional<std::string> change_;
};

} // namespace ito::tasks
