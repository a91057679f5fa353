#include "tasks_file_source.hpp"

#include <algorithm>
#include <regex>
#include <system_error>

#include "internal/audit/event.hpp"
#include "internal/storage/log_file.hpp"
#include "internal/util/errors.hpp"

namespace ito::tasks {

namespace {

const std::regex kTaskHeading(R"(^###\s+Task\s+([^:]+):\s*(.*?)\s*$)");
const std::regex kStatusLine(R"(\*\*Status\*\*:\s*\[([ xX\-~])\]\s+(pending|in-progress|complete|shelved)\s*$)");
const std::regex kCheckboxItem(R"(^\s*[-*]\s\[([ xX~>])\]\s?(.*?)\s*$)");
const std::regex kCheckboxLabel(R"(^([0-9][0-9A-Za-z.\-]*):\s+.*$)");
const std::regex kArchivedName(R"(^\d{4}-\d{2}-\d{2}-(.+)$)");

std::vector<std::string> Lines(std::string_view contents) {
  std::vector<std::string> lines;
  std::size_t              pos = 0;
  while (pos < contents.size()) {
    auto end = contents.find('\n', pos);
    if (end == std::string_view::npos) end = contents.size();
    std::string line(contents.substr(pos, end - pos));
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
    pos = end + 1;
  }
  return lines;
}

bool IsEnhanced(std::string_view contents) {
  return contents.find("- **Status**:") != std::string_view::npos && contents.find("### Task ") != std::string_view::npos;
}

std::vector<TaskEntry> ParseEnhanced(const std::vector<std::string>& lines) {
  std::vector<TaskEntry>   tasks;
  std::optional<TaskEntry> current;

  auto flush = [&]() {
    if (current) tasks.push_back(std::move(*current));
    current.reset();
  };

  for (const auto& line : lines) {
    std::smatch m;
    if (std::regex_match(line, m, kTaskHeading)) {
      flush();
      current = TaskEntry{m[1].str(), "pending"};
    } else if (line.rfind("## ", 0) == 0) {
      // new wave or section ends the current task
      flush();
    } else if (current && std::regex_search(line, m, kStatusLine)) {
      current->status = m[2].str();
    }
  }
  flush();
  return tasks;
}

std::vector<TaskEntry> ParseCheckbox(const std::vector<std::string>& lines) {
  std::vector<TaskEntry> tasks;
  for (const auto& line : lines) {
    std::smatch m;
    if (!std::regex_match(line, m, kCheckboxItem)) continue;

    std::string status;
    switch (m[1].str()[0]) {
      case 'x':
      case 'X':
        status = "complete";
        break;
      case '~':
      case '>':
        status = "in-progress";
        break;
      default:
        status = "pending";
        break;
    }

    std::string rest = m[2].str();
    std::smatch label;
    std::string id = std::regex_match(rest, label, kCheckboxLabel) ? label[1].str() : std::to_string(tasks.size() + 1);
    tasks.push_back({id, status});
  }
  return tasks;
}

} // namespace

std::vector<TaskEntry> ParseTasksFile(std::string_view contents) {
  auto lines = Lines(contents);
  return IsEnhanced(contents) ? ParseEnhanced(lines) : ParseCheckbox(lines);
}

TasksFileSource::TasksFileSource(std::filesystem::path state_dir, std::optional<std::string> change)
    : changes_dir_(std::move(state_dir) / "changes"), change_(std::move(change)) {
}

void TasksFileSource::Collect(audit::FileState* state) const {
  state->scanned_entities.insert(audit::entities::kTask);

  if (change_) {
    CollectChange(*change_, state);
    return;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(changes_dir_, ec)) {
    return;
  }

  std::vector<std::string> changes;
  for (std::filesystem::directory_iterator it(changes_dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_directory()) continue;
    changes.push_back(it->path().filename().string());
  }
  if (ec) {
    throw util::IoError("list " + changes_dir_.string() + ": " + ec.message());
  }
  std::sort(changes.begin(), changes.end());

  for (const auto& change : changes) {
    if (change == "archive") {
      std::error_code archive_ec;
      for (std::filesystem::directory_iterator it(changes_dir_ / "archive", archive_ec), end; !archive_ec && it != end;
           it.increment(archive_ec)) {
        auto        name = it->path().filename().string();
        std::smatch m;
        state->excluded_scopes.insert(name);
        if (std::regex_match(name, m, kArchivedName)) state->excluded_scopes.insert(m[1].str());
      }
      if (archive_ec) {
        throw util::IoError("list " + (changes_dir_ / "archive").string() + ": " + archive_ec.message());
      }
      continue;
    }
    CollectChange(change, state);
  }
}

void TasksFileSource::CollectChange(const std::string& change, audit::FileState* state) const {
  auto path = changes_dir_ / change / "tasks.md";
  if (!storage::Stat(path).exists) {
    return;
  }

  for (const auto& task : ParseTasksFile(storage::ReadAll(path))) {
    audit::EntityKey key{audit::entities::kTask, task.id, change};
    if (!state->values.emplace(key, task.status).second) {
      throw util::ReconcileInputError(path.string() + ": duplicate task id " + task.id);
    }
  }
}

} // namespace ito::tasks
