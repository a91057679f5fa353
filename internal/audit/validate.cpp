#include "validate.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "internal/audit/reader.hpp"

namespace ito::audit {

namespace {

void CheckDuplicateCreates(const std::vector<AuditEvent>& events, std::vector<ValidationIssue>* issues) {
  std::set<EntityKey> seen;
  for (std::size_t i = 0; i < events.size(); ++i) {
    const auto& event = events[i];
    if (event.op() != ops::kCreate && event.op() != ops::kAdd) continue;

    auto key = KeyOf(event);
    if (!seen.insert(key).second) {
      issues->push_back({IssueLevel::Warning, "duplicate " + event.op() + " event for " + key.ToString(), i + 1});
    }
  }
}

void CheckStatusTransitions(const std::vector<AuditEvent>& events, std::vector<ValidationIssue>* issues) {
  std::map<EntityKey, std::string> last;
  for (std::size_t i = 0; i < events.size(); ++i) {
    const auto& event = events[i];
    auto        key   = KeyOf(event);

    if (event.op() == ops::kStatusChange && event.has_from_state()) {
      auto it = last.find(key);
      if (it != last.end() && it->second != event.from_state()) {
        issues->push_back({IssueLevel::Warning,
                           "status transition mismatch for " + key.ToString() + ": expected from='" + it->second + "' but event says from='" +
                               event.from_state() + "'",
                           i + 1});
      }
    }
    if (event.has_to_state()) last[key] = event.to_state();
  }
}

void CheckTimestampOrdering(const std::vector<AuditEvent>& events, std::vector<ValidationIssue>* issues) {
  for (std::size_t i = 1; i < events.size(); ++i) {
    auto prev = util::ParseIso8601(events[i - 1].ts());
    auto cur  = util::ParseIso8601(events[i].ts());
    if (!prev || !cur) continue;
    if (*cur < *prev) {
      issues->push_back({IssueLevel::Warning,
                         "timestamp ordering: " + events[i].ts() + " is earlier than the previous event (" + events[i - 1].ts() + ")",
                         i + 1});
    }
  }
}

} // namespace

const char* ToString(IssueLevel level) {
  return level == IssueLevel::Error ? "error" : "warning";
}

bool ValidationReport::Valid() const {
  return std::none_of(issues.begin(), issues.end(), [](const ValidationIssue& issue) { return issue.level == IssueLevel::Error; });
}

std::vector<ValidationIssue> CheckEvents(const std::vector<AuditEvent>& events) {
  std::vector<ValidationIssue> issues;
  CheckDuplicateCreates(events, &issues);
  CheckStatusTransitions(events, &issues);
  CheckTimestampOrdering(events, &issues);

  std::stable_sort(issues.begin(), issues.end(), [](const ValidationIssue& a, const ValidationIssue& b) { return a.index < b.index; });
  return issues;
}

ValidationReport ValidateLog(const std::filesystem::path& log_path, const std::optional<std::string>& scope) {
  EventFilter filter;
  filter.scope = scope;

  auto read = ReadFiltered(log_path, filter);

  ValidationReport report;
  report.event_count = read.events.size();

  for (const auto& issue : read.issues) {
    report.issues.push_back({IssueLevel::Error, issue.message, issue.line_number});
  }
  for (auto issue : CheckEvents(read.events)) {
    issue.index = read.line_numbers[issue.index - 1];
    report.issues.push_back(std::move(issue));
  }
  std::stable_sort(report.issues.begin(), report.issues.end(),
                   [](const ValidationIssue& a, const ValidationIssue& b) { return a.index < b.index; });

  return report;
}

} // namespace ito::audit
