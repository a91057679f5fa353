#include "fs_writer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/storage/log_file.hpp"
#include "internal/util/errors.hpp"

namespace ito::audit {

using ito::observability::StringField;

FsAuditWriter::FsAuditWriter(std::filesystem::path log_path) : log_path_(std::move(log_path)) {
}

util::Result FsAuditWriter::Append(const AuditEvent& event) {
  if (event.v() != kSchemaVersion) {
    return util::Result::Err(util::ErrorCode::InvalidEvent, "unsupported schema version " + std::to_string(event.v()));
  }
  auto missing = MissingRequiredField(event);
  if (!missing.empty()) {
    return util::Result::Err(util::ErrorCode::InvalidEvent, "missing required field " + missing);
  }

  std::string line;
  try {
    line = SerializeEvent(event);
  } catch (const util::ParseError& ex) {
    return util::Result::Err(util::ErrorCode::SerializationFailure, ex.what());
  }
  line.push_back('\n');

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    storage::AppendLine(log_path_, line);
  } catch (const util::IoError& ex) {
    ITO_LOG_ERROR("audit append failed", {StringField("path", log_path_.string()), StringField("error", ex.what())});
    return util::Result::Err(util::ErrorCode::IOError, ex.what());
  }

  ITO_LOG_DEBUG("audit event appended",
                {StringField("entity", event.entity()), StringField("entity_id", event.entity_id()), StringField("op", event.op())});
  return util::Result::Ok();
}

} // namespace ito::audit
