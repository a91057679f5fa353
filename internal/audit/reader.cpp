#include "reader.hpp"

#include "internal/observability/logging.hpp"
#include "internal/storage/log_file.hpp"
#include "internal/util/errors.hpp"

namespace ito::audit {

using ito::observability::IntField;
using ito::observability::StringField;

bool EventFilter::Matches(const AuditEvent& event) const {
  if (entity && event.entity() != *entity) return false;
  if (entity_id && event.entity_id() != *entity_id) return false;
  if (scope && (!event.has_scope() || event.scope() != *scope)) return false;
  if (op && event.op() != *op) return false;
  if (actor && event.actor() != *actor) return false;

  if (since || until) {
    auto ts = util::ParseIso8601(event.ts());
    if (!ts) return false;
    if (since && *ts < *since) return false;
    if (until && *ts >= *until) return false;
  }
  return true;
}

ReadResult ParseEventLines(std::string_view contents) {
  ReadResult  result;
  std::size_t line_number = 0;
  std::size_t pos         = 0;

  while (pos < contents.size()) {
    auto end = contents.find('\n', pos);
    if (end == std::string_view::npos) end = contents.size();

    auto line = contents.substr(pos, end - pos);
    pos       = end + 1;
    ++line_number;

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.find_first_not_of(" \t") == std::string_view::npos) continue;

    try {
      result.events.push_back(ParseEventLine(line));
      result.line_numbers.push_back(line_number);
    } catch (const util::SchemaVersionError& ex) {
      ++result.unsupported_version_lines;
      result.issues.push_back({line_number, LineIssueKind::UnsupportedVersion, ex.what()});
    } catch (const util::ParseError& ex) {
      ++result.malformed_lines;
      result.issues.push_back({line_number, LineIssueKind::Malformed, ex.what()});
    }
  }

  return result;
}

ReadResult ReadAll(const std::filesystem::path& log_path) {
  auto snapshot = storage::Stat(log_path);
  if (!snapshot.exists) {
    ReadResult result;
    result.file_missing = true;
    return result;
  }

  auto result = ParseEventLines(storage::ReadAll(log_path));
  if (result.skipped_lines() > 0) {
    ITO_LOG_WARN("audit log has skipped lines",
                 {StringField("path", log_path.string()),
                  IntField("malformed", static_cast<int64_t>(result.malformed_lines)),
                  IntField("unsupported_version", static_cast<int64_t>(result.unsupported_version_lines))});
  }
  return result;
}

ReadResult ReadFiltered(const std::filesystem::path& log_path, const EventFilter& filter) {
  auto result = ReadAll(log_path);

  std::vector<AuditEvent>  kept;
  std::vector<std::size_t> kept_lines;
  kept.reserve(result.events.size());
  kept_lines.reserve(result.events.size());
  for (std::size_t i = 0; i < result.events.size(); ++i) {
    if (!filter.Matches(result.events[i])) continue;
    kept.push_back(std::move(result.events[i]));
    kept_lines.push_back(result.line_numbers[i]);
  }
  result.events       = std::move(kept);
  result.line_numbers = std::move(kept_lines);
  return result;
}

} // namespace ito::audit
