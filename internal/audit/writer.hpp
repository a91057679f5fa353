#pragma once

#include <memory>

#include "internal/audit/event.hpp"
#include "internal/util/result.hpp"

namespace ito::audit {

/*
  Writer port.

  The only component allowed to mutate a log, and only by appending.
  Implementations:
    FsAuditWriter    → durable NDJSON append (fs_writer.hpp)
    NoopAuditWriter  → discards everything (bootstrap / disabled)

  Callers hold an AuditWriter& or shared_ptr and never branch on which
  implementation is active.
*/
class AuditWriter {
 public:
  virtual ~AuditWriter() = default;

  /*
    Append one event.

    A non-OK result means the event was NOT persisted. Whether that is
    fatal for the triggering operation is the caller's policy.
  */
  virtual util::Result Append(const AuditEvent& event) = 0;
};

using AuditWriterPtr = std::shared_ptr<AuditWriter>;

class NoopAuditWriter final : public AuditWriter {
 public:
  util::Result Append(const AuditEvent&) override {
    return util::Result::Ok();
  }
};

} // namespace ito::audit
