#include "stream.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ito::audit {

using ito::observability::IntField;
using ito::observability::StringField;

namespace {

constexpr std::string_view kCursorPrefix = "v1:";
constexpr std::size_t      kCursorFields = 6;

uint64_t Fingerprint(std::string_view bytes) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

template <typename T>
bool ParseNumber(std::string_view text, T* out) {
  if (text.empty()) return false;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), *out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

/*
  Decode the complete lines of `buffer`, which starts at `base` in the file.
  Bytes after the last '\n' are not consumed.
*/
StreamBatch ConsumeLines(const std::string& buffer, const StreamCursor& base, const std::string& source) {
  StreamBatch batch;
  batch.cursor = base;

  int64_t  offset   = base.offset();
  uint64_t sequence = base.sequence();

  std::size_t pos = 0;
  while (pos < buffer.size()) {
    auto end = buffer.find('\n', pos);
    if (end == std::string::npos) break; // partial line, wait for the writer

    std::string_view raw(buffer.data() + pos, end - pos + 1);
    std::string_view line = raw.substr(0, raw.size() - 1);
    offset += static_cast<int64_t>(raw.size());
    ++sequence;
    pos = end + 1;

    StreamCursor here(offset, sequence, base.identity(), static_cast<int64_t>(raw.size()), Fingerprint(raw));
    batch.cursor = here;

    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (line.find_first_not_of(" \t") == std::string_view::npos) continue;

    try {
      batch.events.push_back({ParseEventLine(line), here, source});
    } catch (const util::ParseError& ex) {
      // SchemaVersionError included; both are skipped and counted
      ++batch.skipped_lines;
      ITO_LOG_DEBUG("stream skipped line", {IntField("line", static_cast<int64_t>(sequence)), StringField("error", ex.what())});
    }
  }

  return batch;
}

StreamBatch ReadFromStart(const std::filesystem::path& log_path, const storage::FileSnapshot& snapshot, const std::string& source) {
  StreamCursor start(0, 0, snapshot.identity);
  return ConsumeLines(storage::ReadRange(log_path, 0, snapshot.size), start, source);
}

/*
  True when `window`, the bytes just before the cursor's offset, still
  ends with the line the cursor last consumed.
*/
bool TailMatches(std::string_view window, const StreamCursor& cursor) {
  if (window.empty() || window.back() != '\n') return false;
  if (cursor.tail_length() == 0) return true;
  return static_cast<int64_t>(window.size()) == cursor.tail_length() && Fingerprint(window) == cursor.tail_hash();
}

} // namespace

// ------------------------------------------------------------
// StreamCursor
// ------------------------------------------------------------

bool StreamCursor::operator==(const StreamCursor& other) const {
  return offset_ == other.offset_ && sequence_ == other.sequence_ && identity_ == other.identity_ &&
         tail_length_ == other.tail_length_ && tail_hash_ == other.tail_hash_;
}

bool StreamCursor::operator<(const StreamCursor& other) const {
  return std::tie(identity_.device, identity_.inode, offset_, sequence_) <
         std::tie(other.identity_.device, other.identity_.inode, other.offset_, other.sequence_);
}

std::string StreamCursor::ToString() const {
  return std::string(kCursorPrefix) + std::to_string(identity_.device) + ":" + std::to_string(identity_.inode) + ":" +
         std::to_string(offset_) + ":" + std::to_string(sequence_) + ":" + std::to_string(tail_length_) + ":" +
         std::to_string(tail_hash_);
}

std::optional<StreamCursor> StreamCursor::Parse(std::string_view text) {
  if (text.substr(0, kCursorPrefix.size()) != kCursorPrefix) return std::nullopt;
  text.remove_prefix(kCursorPrefix.size());

  std::string_view parts[kCursorFields];
  for (std::size_t i = 0; i < kCursorFields; ++i) {
    auto colon = text.find(':');
    if (i + 1 < kCursorFields) {
      if (colon == std::string_view::npos) return std::nullopt;
      parts[i] = text.substr(0, colon);
      text.remove_prefix(colon + 1);
    } else {
      if (colon != std::string_view::npos) return std::nullopt;
      parts[i] = text;
    }
  }

  storage::FileIdentity identity;
  int64_t               offset      = 0;
  uint64_t              sequence    = 0;
  int64_t               tail_length = 0;
  uint64_t              tail_hash   = 0;
  if (!ParseNumber(parts[0], &identity.device) || !ParseNumber(parts[1], &identity.inode) || !ParseNumber(parts[2], &offset) ||
      !ParseNumber(parts[3], &sequence) || !ParseNumber(parts[4], &tail_length) || !ParseNumber(parts[5], &tail_hash) || offset < 0 ||
      tail_length < 0 || tail_length > offset) {
    return std::nullopt;
  }
  return StreamCursor(offset, sequence, identity, tail_length, tail_hash);
}

// ------------------------------------------------------------
// Single log
// ------------------------------------------------------------

StreamConfig StreamConfig::FromSettings(const ito::runtime::config::StreamSettings& settings) {
  StreamConfig config;
  if (settings.poll_interval_ms() > 0) {
    config.poll_interval = std::chrono::milliseconds(settings.poll_interval_ms());
  }
  if (settings.last() > 0) {
    config.last = settings.last();
  }
  config.all_worktrees = settings.all_worktrees();
  return config;
}

StreamBatch ReadInitialEvents(const std::filesystem::path& log_path, const StreamConfig& config, const std::string& source) {
  if (config.start_cursor) {
    return PollNewEvents(log_path, *config.start_cursor, source);
  }

  auto snapshot = storage::Stat(log_path);
  if (!snapshot.exists) {
    return {};
  }

  auto batch = ReadFromStart(log_path, snapshot, source);
  if (config.last && batch.events.size() > *config.last) {
    batch.events.erase(batch.events.begin(), batch.events.end() - static_cast<std::ptrdiff_t>(*config.last));
  }
  return batch;
}

StreamBatch PollNewEvents(const std::filesystem::path& log_path, const StreamCursor& cursor, const std::string& source) {
  auto snapshot = storage::Stat(log_path);

  if (!snapshot.exists) {
    StreamBatch batch;
    if (cursor.IsStart()) {
      batch.cursor = cursor;
    } else {
      ITO_LOG_WARN("audit log disappeared, stream reset", {StringField("path", log_path.string())});
      batch.resynced = true;
    }
    return batch;
  }

  if (cursor.IsStart()) {
    return ReadFromStart(log_path, snapshot, source);
  }

  auto resync = [&]() {
    ITO_LOG_WARN("audit log truncated or replaced, resynchronizing",
                 {StringField("path", log_path.string()), IntField("size", snapshot.size), IntField("cursor_offset", cursor.offset())});
    auto batch     = ReadFromStart(log_path, snapshot, source);
    batch.resynced = true;
    return batch;
  };

  if (snapshot.identity != cursor.identity() || snapshot.size < cursor.offset()) {
    return resync();
  }

  // Re-read the cursor's last line along with the new bytes; an inode
  // number can be reused by a recreated log.
  const int64_t window = cursor.offset() == 0 ? 0 : std::max<int64_t>(cursor.tail_length(), 1);
  const int64_t start  = cursor.offset() - window;
  auto          buffer = storage::ReadRange(log_path, start, snapshot.size - start);

  if (window > 0 && (static_cast<int64_t>(buffer.size()) < window ||
                     !TailMatches(std::string_view(buffer.data(), static_cast<std::size_t>(window)), cursor))) {
    return resync();
  }

  buffer.erase(0, static_cast<std::size_t>(window));
  if (buffer.empty()) {
    StreamBatch batch;
    batch.cursor = cursor;
    return batch;
  }
  return ConsumeLines(buffer, cursor, source);
}

// ------------------------------------------------------------
// Multiple worktrees
// ------------------------------------------------------------

namespace {

bool SamePath(const std::filesystem::path& a, const std::filesystem::path& b) {
  std::error_code ec;
  auto            equivalent = std::filesystem::equivalent(a, b, ec);
  if (ec) return a.lexically_normal() == b.lexically_normal();
  return equivalent;
}

void Merge(MultiStreamBatch* out, StreamBatch&& batch, const StreamSource& source) {
  out->skipped_lines += batch.skipped_lines;
  if (batch.resynced) out->resynced_sources.push_back(source.label);
  for (auto& event : batch.events) {
    out->events.push_back(std::move(event));
  }
}

} // namespace

MultiStreamBatch ReadInitialSources(const std::filesystem::path& project_root,
                                    const LogLayout&             layout,
                                    const StreamConfig&          config,
                                    std::vector<StreamSource>*   sources) {
  sources->clear();
  sources->push_back({"main", layout.LogPath(project_root), {}});

  if (config.all_worktrees) {
    for (const auto& wt : DiscoverWorktrees(project_root)) {
      if (SamePath(wt.path, project_root)) continue;
      sources->push_back({wt.Label(), layout.LogPath(wt.path), {}});
    }
  }

  return ReadInitialSources(config, sources);
}

MultiStreamBatch ReadInitialSources(const StreamConfig& config, std::vector<StreamSource>* sources) {
  // A start cursor only makes sense for a single log.
  StreamConfig per_source = config;
  if (sources->size() > 1) per_source.start_cursor.reset();

  MultiStreamBatch          out;
  std::vector<StreamSource> readable;
  for (auto& source : *sources) {
    StreamBatch batch;
    try {
      batch = ReadInitialEvents(source.log_path, per_source, source.label);
    } catch (const util::IoError& ex) {
      ITO_LOG_WARN("stream source excluded", {StringField("source", source.label), StringField("error", ex.what())});
      out.failed_sources.push_back({source.label, ex.what()});
      continue;
    }
    source.cursor = batch.cursor;
    Merge(&out, std::move(batch), source);
    readable.push_back(std::move(source));
  }
  *sources = std::move(readable);
  return out;
}

MultiStreamBatch PollSources(std::vector<StreamSource>* sources) {
  MultiStreamBatch out;
  for (auto& source : *sources) {
    StreamBatch batch;
    try {
      batch = PollNewEvents(source.log_path, source.cursor, source.label);
    } catch (const util::IoError& ex) {
      // one unreadable worktree must not stop the others
      ITO_LOG_WARN("stream poll failed", {StringField("source", source.label), StringField("error", ex.what())});
      out.failed_sources.push_back({source.label, ex.what()});
      continue;
    }
    source.cursor = batch.cursor;
    Merge(&out, std::move(batch), source);
  }
  return out;
}

} // namespace ito::audit
