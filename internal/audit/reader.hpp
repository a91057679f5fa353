#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/audit/event.hpp"

namespace ito::audit {

/*
  Read-side filter. Every set field must match; an empty filter matches
  everything. The time range is half-open: since <= ts < until.
*/
struct EventFilter {
  std::optional<std::string>     entity;
  std::optional<std::string>     entity_id;
  std::optional<std::string>     scope;
  std::optional<std::string>     op;
  std::optional<std::string>     actor;
  std::optional<util::TimePoint> since;
  std::optional<util::TimePoint> until;

  bool Matches(const AuditEvent& event) const;
};

enum class LineIssueKind { Malformed, UnsupportedVersion };

struct LineIssue {
  std::size_t   line_number{0}; // 1-based
  LineIssueKind kind{LineIssueKind::Malformed};
  std::string   message;
};

struct ReadResult {
  std::vector<AuditEvent>  events;       // physical order
  std::vector<std::size_t> line_numbers; // 1-based line of each entry in events
  std::size_t              malformed_lines{0};
  std::size_t              unsupported_version_lines{0};
  std::vector<LineIssue>   issues;
  bool                     file_missing{false};

  std::size_t skipped_lines() const {
    return malformed_lines + unsupported_version_lines;
  }
};

/*
  Decode an in-memory NDJSON buffer. Blank lines are ignored; bad lines
  are skipped and counted.
*/
ReadResult ParseEventLines(std::string_view contents);

/*
  Load every event in one log file.

  A missing file yields an empty result with file_missing set. Any other
  I/O failure throws util::IoError.
*/
ReadResult ReadAll(const std::filesystem::path& log_path);

ReadResult ReadFiltered(const std::filesystem::path& log_path, const EventFilter& filter);

} // namespace ito::audit
