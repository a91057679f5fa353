#pragma once

#include <filesystem>
#include <vector>

#include "config/config.pb.h"

#include "internal/audit/context.hpp"
#include "internal/audit/paths.hpp"
#include "internal/audit/reconcile.hpp"

namespace ito::factory {

/*
  Application

  Everything one ito-audit invocation works with. Lives for the duration
  of the command.
*/
struct Application {
  std::filesystem::path                    project_root;
  audit::LogLayout                         layout;
  audit::AuditContext                      audit;
  std::vector<audit::EntityStateSourcePtr> state_sources;
  audit::ReconcileOptions                  reconcile_options;
};

/*
  BuildAuditContext

  Picks the writer implementation:
    FsAuditWriter    auditing enabled and <root>/<state_dir> exists
    NoopAuditWriter  otherwise (disabled, or project not initialised yet)

  Provenance (session, git, user) is only resolved for the durable writer.
*/
audit::AuditContext BuildAuditContext(const ito::runtime::config::AuditConfig& config, const std::filesystem::path& project_root);

// Whether the command appends events. Read-only commands get a no-op
// writer and skip session, git and user resolution.
enum class AuditAccess { ReadOnly, Write };

/*
  Build

  Composition root: the only place that knows concrete writer and
  file-state source types.
*/
Application Build(const ito::runtime::config::RuntimeConfig& config,
                  const std::filesystem::path&               project_root,
                  AuditAccess                                access = AuditAccess::ReadOnly);

} // namespace ito::factory
