#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/audit/event.hpp"
#include "internal/audit/paths.hpp"
#include "internal/audit/worktree.hpp"
#include "internal/storage/log_file.hpp"

namespace ito::audit {

/*
  Position in one log.

  Callers treat it as opaque: compare it, persist it with ToString() and
  restore it with Parse(). It always points at a line boundary. Besides
  the identity of the file it was taken from it keeps a fingerprint of the
  last line it consumed, since a deleted and recreated log may come back
  with the same inode number. A poll whose file no longer holds that line
  just before the offset is treated as a replaced log.
*/
class StreamCursor {
 public:
  StreamCursor() = default;
  StreamCursor(int64_t offset, uint64_t sequence, storage::FileIdentity identity, int64_t tail_length = 0, uint64_t tail_hash = 0)
      : offset_(offset), sequence_(sequence), identity_(identity), tail_length_(tail_length), tail_hash_(tail_hash) {
  }

  int64_t offset() const {
    return offset_;
  }
  // Complete lines consumed so far, including skipped ones.
  uint64_t sequence() const {
    return sequence_;
  }
  const storage::FileIdentity& identity() const {
    return identity_;
  }
  // Length in bytes (with the '\n') and FNV-1a hash of the line ending at offset().
  int64_t tail_length() const {
    return tail_length_;
  }
  uint64_t tail_hash() const {
    return tail_hash_;
  }

  // True for the cursor of a log that did not exist yet.
  bool IsStart() const {
    return offset_ == 0 && identity_ == storage::FileIdentity{};
  }

  bool operator==(const StreamCursor& other) const;
  bool operator!=(const StreamCursor& other) const {
    return !(*this == other);
  }
  bool operator<(const StreamCursor& other) const;

  // "v1:<device>:<inode>:<offset>:<sequence>:<tail_length>:<tail_hash>"
  std::string                        ToString() const;
  static std::optional<StreamCursor> Parse(std::string_view text);

 private:
  int64_t               offset_{0};
  uint64_t              sequence_{0};
  storage::FileIdentity identity_;
  int64_t               tail_length_{0};
  uint64_t              tail_hash_{0};
};

struct StreamConfig {
  std::chrono::milliseconds   poll_interval{500};
  std::optional<StreamCursor> start_cursor;
  // Initial read emits only the newest N events; nullopt emits all.
  std::optional<std::size_t> last;
  bool                       all_worktrees{false};

  static StreamConfig FromSettings(const ito::runtime::config::StreamSettings& settings);
};

struct StreamEvent {
  AuditEvent   event;
  StreamCursor cursor; // position just past this event's line
  std::string  source;
};

struct StreamBatch {
  std::vector<StreamEvent> events;
  StreamCursor             cursor;
  std::size_t              skipped_lines{0};
  // The log shrank or was replaced; events were re-read from its start.
  bool resynced{false};
};

/*
  First read of a log.

  With config.start_cursor set this resumes from it (same rules as
  PollNewEvents). Otherwise every complete line is read and the returned
  cursor marks the end of the last complete line. A trailing line without
  '\n' is left for the next poll.
*/
StreamBatch ReadInitialEvents(const std::filesystem::path& log_path, const StreamConfig& config, const std::string& source = "main");

/*
  Events appended after `cursor`.

  Never re-emits an event at or before the cursor. When the file is
  smaller than the cursor, has a different identity, or no longer ends the
  cursor's last line at its offset, the whole file is re-read and the
  batch is marked resynced.
*/
StreamBatch PollNewEvents(const std::filesystem::path& log_path, const StreamCursor& cursor, const std::string& source = "main");

/*
  One tailed log in a multi-worktree stream.
*/
struct StreamSource {
  std::string           label;
  std::filesystem::path log_path;
  StreamCursor          cursor;
};

struct FailedSource {
  std::string label;
  std::string reason;
};

struct MultiStreamBatch {
  std::vector<StreamEvent>  events;
  std::size_t               skipped_lines{0};
  std::vector<std::string>  resynced_sources;
  std::vector<FailedSource> failed_sources;
};

/*
  Tail the project root's log and, with all_worktrees, every other
  worktree's log. Initial events are ordered per source in the order of
  `sources`.
*/
MultiStreamBatch ReadInitialSources(const std::filesystem::path& project_root,
                                    const LogLayout&             layout,
                                    const StreamConfig&          config,
                                    std::vector<StreamSource>*   sources);

/*
  Initial read of already listed sources. A source whose log cannot be
  read is reported in failed_sources and removed from `sources`; the
  others are still read.
*/
MultiStreamBatch ReadInitialSources(const StreamConfig& config, std::vector<StreamSource>* sources);

// A source that fails a poll is reported and keeps its cursor for the next poll.
MultiStreamBatch PollSources(std::vector<StreamSource>* sources);

} // namespace ito::audit
