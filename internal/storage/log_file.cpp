#include "log_file.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <system_error>

namespace ito::storage {

FileSnapshot Stat(const std::filesystem::path& path) {
  FileSnapshot snapshot;

  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      return snapshot;
    }
    throw ito::util::IoError("stat " + path.string() + ": " + std::strerror(errno));
  }

  if (!S_ISREG(st.st_mode)) {
    throw ito::util::IoError("not a regular file: " + path.string());
  }

  snapshot.exists          = true;
  snapshot.size            = static_cast<int64_t>(st.st_size);
  snapshot.identity.device = static_cast<uint64_t>(st.st_dev);
  snapshot.identity.inode  = static_cast<uint64_t>(st.st_ino);
  return snapshot;
}

namespace {

void EnsureParent(const std::filesystem::path& path) {
  if (!path.has_parent_path()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    throw ito::util::IoError("create " + path.parent_path().string() + ": " + ec.message());
  }
}

} // namespace

void AppendLine(const std::filesystem::path& path, const std::string& line) {
  EnsureParent(path);

  auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string(), /*append=*/true));
  Unwrap(out->Write(line.data(), static_cast<int64_t>(line.size())));
  Unwrap(out->Flush());
  Unwrap(out->Close());
}

void WriteFile(const std::filesystem::path& path, const std::string& contents) {
  EnsureParent(path);

  auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string(), /*append=*/false));
  Unwrap(out->Write(contents.data(), static_cast<int64_t>(contents.size())));
  Unwrap(out->Close());
}

std::string ReadRange(const std::filesystem::path& path, int64_t offset, int64_t length) {
  if (length <= 0) {
    return {};
  }

  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = Unwrap(file->ReadAt(offset, length));
  Unwrap(file->Close());
  return buffer->ToString();
}

std::string ReadAll(const std::filesystem::path& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto size   = Unwrap(file->GetSize());
  auto buffer = Unwrap(file->ReadAt(0, size));
  Unwrap(file->Close());
  return buffer->ToString();
}

} // namespace ito::storage
