#include "internal/tasks/tasks_file_source.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using ito::audit::EntityKey;
using ito::audit::FileState;

std::filesystem::path FreshDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / "ito_audit_tasks_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void WriteTasks(const std::filesystem::path& state_dir, const std::string& change, const std::string& contents) {
  auto dir = state_dir / "changes" / change;
  std::filesystem::create_directories(dir);
  std::ofstream out(dir / "tasks.md");
  out << contents;
}

const char* kEnhanced =
    "# Tasks\n"
    "\n"
    "## Wave 1\n"
    "\n"
    "### Task 1.1: Write parser\n"
    "- **Files**: `src/parse.cpp`\n"
    "- **Status**: [x] complete\n"
    "\n"
    "### Task 1.2: Wire CLI\n"
    "- **Status**: [ ] in-progress\n"
    "\n"
    "### Task 1.3: Docs\n"
    "- **Status**: [-] shelved\n"
    "\n"
    "## Wave 2\n"
    "\n"
    "### Task 2.1: Untracked status\n"
    "- **Action**: nothing yet\n"
    "- **Status**: unknown\n"
    "\n"
    "## Checkpoints\n"
    "\n"
    "### Checkpoint: Review\n"
    "- **Status**: [ ] pending\n";

void TestParseEnhancedFormat() {
  auto tasks = ito::tasks::ParseTasksFile(kEnhanced);
  assert(tasks.size() == 4);
  assert(tasks[0].id == "1.1" && tasks[0].status == "complete");
  assert(tasks[1].id == "1.2" && tasks[1].status == "in-progress");
  assert(tasks[2].id == "1.3" && tasks[2].status == "shelved");
  assert(tasks[3].id == "2.1" && tasks[3].status == "pending");
}

void TestParseCheckboxFormat() {
  auto tasks = ito::tasks::ParseTasksFile("# Tasks\n- [ ] 1.1: First task\n- [x] Second task\n* [~] Third\nplain text\n- [?] ignored\n");
  assert(tasks.size() == 3);
  assert(tasks[0].id == "1.1" && tasks[0].status == "pending");
  assert(tasks[1].id == "2" && tasks[1].status == "complete");
  assert(tasks[2].id == "3" && tasks[2].status == "in-progress");
}

void TestCollectScansEveryActiveChange() {
  auto state_dir = FreshDir("collect") / ".ito";
  WriteTasks(state_dir, "change-a", kEnhanced);
  WriteTasks(state_dir, "change-b", "- [x] 1: Only\n");
  WriteTasks(state_dir, "archive/2026-01-01-old-change", "- [ ] 1: Old\n");
  std::filesystem::create_directories(state_dir / "changes" / "no-tasks");

  ito::tasks::TasksFileSource source(state_dir);
  FileState                   state;
  source.Collect(&state);

  assert(state.values.size() == 5);
  assert(state.values.at(EntityKey{"task", "1.1", std::string("change-a")}) == "complete");
  assert(state.values.at(EntityKey{"task", "1", std::string("change-b")}) == "complete");
  assert(state.scanned_entities.count("task") == 1);
  assert(state.excluded_scopes.count("old-change") == 1);
  assert(state.excluded_scopes.count("2026-01-01-old-change") == 1);
  assert(!state.Covers(EntityKey{"task", "1", std::string("old-change")}));
  assert(!state.Covers(EntityKey{"change", "change-a", std::nullopt}));
}

void TestCollectSingleChange() {
  auto state_dir = FreshDir("single") / ".ito";
  WriteTasks(state_dir, "change-a", kEnhanced);
  WriteTasks(state_dir, "change-b", "- [x] 1: Only\n");

  ito::tasks::TasksFileSource source(state_dir, std::string("change-b"));
  FileState                   state;
  source.Collect(&state);
  assert(state.values.size() == 1);
}

void TestMissingChangesDirIsEmpty() {
  ito::tasks::TasksFileSource source(FreshDir("empty") / ".ito");
  FileState                   state;
  source.Collect(&state);
  assert(state.values.empty());
}

void TestDuplicateTaskIdIsRejected() {
  auto state_dir = FreshDir("duplicate") / ".ito";
  WriteTasks(state_dir, "dup", "### Task 1.1: A\n- **Status**: [ ] pending\n### Task 1.1: B\n- **Status**: [x] complete\n");

  ito::tasks::TasksFileSource source(state_dir);
  FileState                   state;
  bool                        threw = false;
  try {
    source.Collect(&state);
  } catch (const ito::util::ReconcileInputError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestParseEnhancedFormat();
  TestParseCheckboxFormat();
  TestCollectScansEveryActiveChange();
  TestCollectSingleChange();
  TestMissingChangesDirIsEmpty();
  TestDuplicateTaskIdIsRejected();

  std::cout << "ito_audit_unit_tasks_file_source: pass\n";
  return 0;
}
