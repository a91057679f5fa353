#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/event.hpp"

namespace ito::audit {

enum class IssueLevel { Warning, Error };

const char* ToString(IssueLevel level);

struct ValidationIssue {
  IssueLevel  level{IssueLevel::Warning};
  std::string message;
  // 1-based position the issue points at: the event's index for
  // CheckEvents, the physical line for ValidateLog
  std::size_t index{0};
};

struct ValidationReport {
  std::size_t                  event_count{0};
  std::vector<ValidationIssue> issues; // sorted by index

  bool Valid() const;
};

/*
  Semantic checks over events in log order:
    - duplicate create/add for the same key      (warning)
    - status_change whose from disagrees with the last known value (warning)
    - timestamp earlier than the previous event  (warning)
*/
std::vector<ValidationIssue> CheckEvents(const std::vector<AuditEvent>& events);

/*
  Read one log (optionally restricted to a scope) and check it.
  Lines the reader had to skip are reported as errors. Every issue's index
  is a physical line number.
*/
ValidationReport ValidateLog(const std::filesystem::path& log_path, const std::optional<std::string>& scope = std::nullopt);

} // namespace ito::audit
