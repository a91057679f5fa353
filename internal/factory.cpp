#include "factory.hpp"

#include <memory>
#include <system_error>

#include "internal/audit/fs_writer.hpp"
#include "internal/audit/writer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tasks/tasks_file_source.hpp"

namespace ito::factory {

using ito::observability::BoolField;
using ito::observability::StringField;

namespace {

void UseNoopWriter(audit::AuditContext* ctx) {
  ctx->writer  = std::make_shared<audit::NoopAuditWriter>();
  ctx->enabled = false;
  ctx->event_context.set_session_id("none");
}

} // namespace

audit::AuditContext BuildAuditContext(const ito::runtime::config::AuditConfig& config, const std::filesystem::path& project_root) {
  auto layout = audit::LogLayout::FromConfig(config);

  audit::AuditContext ctx;
  ctx.log_path             = layout.LogPath(project_root);
  ctx.fail_on_append_error = !config.has_fail_on_append_error() || config.fail_on_append_error();

  const bool      enabled = !config.has_enabled() || config.enabled();
  std::error_code ec;
  const bool      state_dir_exists = std::filesystem::is_directory(layout.StateDir(project_root), ec);

  if (!enabled || !state_dir_exists) {
    ITO_LOG_DEBUG("audit writer disabled", {BoolField("enabled", enabled), StringField("state_dir", layout.StateDir(project_root).string())});
    UseNoopWriter(&ctx);
    return ctx;
  }

  ctx.writer        = std::make_shared<audit::FsAuditWriter>(ctx.log_path);
  ctx.enabled       = true;
  ctx.event_context = audit::ResolveEventContext(project_root, layout);
  ctx.user          = audit::ResolveUserIdentity(project_root);

  ITO_LOG_DEBUG("audit writer ready",
                {StringField("log", ctx.log_path.string()), StringField("session_id", ctx.event_context.session_id())});
  return ctx;
}

Application Build(const ito::runtime::config::RuntimeConfig& config, const std::filesystem::path& project_root, AuditAccess access) {
  Application app;
  app.project_root = project_root;
  app.layout       = audit::LogLayout::FromConfig(config.audit());

  if (access == AuditAccess::Write) {
    app.audit = BuildAuditContext(config.audit(), project_root);
  } else {
    app.audit.log_path = app.layout.LogPath(project_root);
    UseNoopWriter(&app.audit);
  }

  // File-state collaborators, one per tracked file kind
  app.state_sources.push_back(std::make_shared<tasks::TasksFileSource>(app.layout.StateDir(project_root)));

  for (const auto& entity : config.reconcile().orphan_entities()) {
    app.reconcile_options.orphan_entities.insert(entity);
  }

  return app;
}

} // namespace ito::factory
