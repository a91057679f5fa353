#pragma once

#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace ito::storage {

/*
  Helper: unwrap Arrow Result<T> or throw util::IoError
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw ito::util::IoError(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw ito::util::IoError(status.ToString());
}

/*
  Identity of the inode behind a path. A rename-replaced log shows up as a
  new identity; a deleted and recreated one may not, because filesystems
  reuse freed inode numbers, so readers also check content.
*/
struct FileIdentity {
  uint64_t device{0};
  uint64_t inode{0};

  bool operator==(const FileIdentity& other) const {
    return device == other.device && inode == other.inode;
  }
  bool operator!=(const FileIdentity& other) const {
    return !(*this == other);
  }
};

struct FileSnapshot {
  bool         exists{false};
  int64_t      size{0};
  FileIdentity identity;
};

// stat() the path. Missing file is not an error; other failures throw IoError.
FileSnapshot Stat(const std::filesystem::path& path);

/*
  Durable line append:
      open O_APPEND → single write → flush → close

  The line must already end in '\n'. Parent directories are created.
  Throws IoError on any failure; nothing is written on open failure.
*/
void AppendLine(const std::filesystem::path& path, const std::string& line);

// Replace the file's contents. Parent directories are created.
void WriteFile(const std::filesystem::path& path, const std::string& contents);

// Read [offset, offset + length) from the file. Short reads at EOF are returned as-is.
std::string ReadRange(const std::filesystem::path& path, int64_t offset, int64_t length);

// Read the entire file.
std::string ReadAll(const std::filesystem::path& path);

} // namespace ito::storage
