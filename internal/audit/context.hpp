#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "internal/audit/event.hpp"
#include "internal/audit/paths.hpp"
#include "internal/audit/writer.hpp"

namespace ito::audit {

/*
  Best-effort provenance resolution. Nothing here fails: a missing git
  binary, a detached HEAD or an unwritable session file only leaves the
  corresponding field unset (or the session id unpersisted).
*/

struct GitContext {
  std::optional<std::string> branch;
  std::optional<std::string> worktree; // set only inside a linked worktree
  std::optional<std::string> commit;   // 8-char short hash
};

/*
  Session id for this checkout, stored in `session_file`.
  Generated (UUID v4) and persisted on first use.
*/
std::string ResolveSessionId(const std::filesystem::path& session_file);

// First non-empty of ITO_HARNESS_SESSION_ID, CLAUDE_SESSION_ID, OPENCODE_SESSION_ID, CODEX_SESSION_ID.
std::optional<std::string> ResolveHarnessSessionId();

GitContext ResolveGitContext(const std::filesystem::path& worktree_root);

// "Jane Doe" → "@jane-doe"
std::string NormalizeIdentity(std::string_view name);

// From `git config user.name`, then $USER, then "unknown".
std::string ResolveUserIdentity(const std::filesystem::path& worktree_root);

EventContext ResolveEventContext(const std::filesystem::path& worktree_root, const LogLayout& layout);

/*
  Everything a command needs to record audit events, passed explicitly
  instead of living in process-wide state. Built by BuildAuditContext
  (internal/factory.hpp); tests construct it directly with a fake writer.
*/
struct AuditContext {
  AuditWriterPtr        writer;
  EventContext          event_context;
  std::string           user{"@unknown"};
  std::filesystem::path log_path;
  bool                  enabled{false};
  bool                  fail_on_append_error{true};

  /*
    Stamp `event` with this context (ctx, and by when empty) and append it.
    With fail_on_append_error a failed append throws util::IoError (or
    runtime_error); otherwise it is logged and returned.
  */
  util::Result Record(AuditEvent event) const;
};

} // namespace ito::audit
