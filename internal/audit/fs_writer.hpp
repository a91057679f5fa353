#pragma once

#include <filesystem>
#include <mutex>

#include "internal/audit/writer.hpp"

namespace ito::audit {

/*
  Filesystem-backed writer.

  Properties:
    - one JSON object per line, newline terminated
    - each Append opens in append mode and issues a single write, so
      lines from concurrent processes never interleave
    - flushed before returning; existing lines are never touched
    - parent directories are created on first write
*/
class FsAuditWriter final : public AuditWriter {
 public:
  explicit FsAuditWriter(std::filesystem::path log_path);

  util::Result Append(const AuditEvent& event) override;

  const std::filesystem::path& log_path() const {
    return log_path_;
  }

 private:
  std::filesystem::path log_path_;
  std::mutex            mutex_;
};

} // namespace ito::audit
