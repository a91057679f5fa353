#include "context.hpp"

#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <system_error>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/log_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"
#include "internal/util/uuid.hpp"

namespace ito::audit {

using ito::observability::StringField;

namespace {

std::optional<std::string> Git(const std::filesystem::path& root, std::initializer_list<std::string> args) {
  std::vector<std::string> argv{"git", "-C", root.string()};
  argv.insert(argv.end(), args.begin(), args.end());
  return util::RunCommandTrimmed(argv);
}

std::string Trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::filesystem::path Canonical(const std::filesystem::path& root, const std::string& reported) {
  std::filesystem::path p(reported);
  if (p.is_relative()) p = root / p;
  std::error_code ec;
  auto            canonical = std::filesystem::weakly_canonical(p, ec);
  return ec ? p.lexically_normal() : canonical;
}

std::optional<std::string> DetectWorktreeName(const std::filesystem::path& root) {
  auto git_dir    = Git(root, {"rev-parse", "--git-dir"});
  auto common_dir = Git(root, {"rev-parse", "--git-common-dir"});
  if (!git_dir || !common_dir) return std::nullopt;
  if (Canonical(root, *git_dir) == Canonical(root, *common_dir)) return std::nullopt;

  auto toplevel = Git(root, {"rev-parse", "--show-toplevel"});
  if (!toplevel) return std::nullopt;
  auto name = std::filesystem::path(*toplevel).filename().string();
  if (name.empty()) return std::nullopt;
  return name;
}

} // namespace

std::string ResolveSessionId(const std::filesystem::path& session_file) {
  try {
    if (storage::Stat(session_file).exists) {
      auto stored = Trim(storage::ReadAll(session_file));
      if (!stored.empty()) return stored;
    }
  } catch (const util::IoError& ex) {
    ITO_LOG_WARN("session file unreadable, starting a new session", {StringField("path", session_file.string()), StringField("error", ex.what())});
  }

  auto id = util::GenerateUuidV4();
  try {
    storage::WriteFile(session_file, id);
  } catch (const util::IoError& ex) {
    ITO_LOG_WARN("session id not persisted", {StringField("path", session_file.string()), StringField("error", ex.what())});
  }
  return id;
}

std::optional<std::string> ResolveHarnessSessionId() {
  for (const char* name : {"ITO_HARNESS_SESSION_ID", "CLAUDE_SESSION_ID", "OPENCODE_SESSION_ID", "CODEX_SESSION_ID"}) {
    if (const char* value = std::getenv(name)) {
      if (*value != '\0') return std::string(value);
    }
  }
  return std::nullopt;
}

GitContext ResolveGitContext(const std::filesystem::path& worktree_root) {
  GitContext git;
  git.branch   = Git(worktree_root, {"symbolic-ref", "--short", "HEAD"});
  git.commit   = Git(worktree_root, {"rev-parse", "--short=8", "HEAD"});
  git.worktree = DetectWorktreeName(worktree_root);
  return git;
}

std::string NormalizeIdentity(std::string_view name) {
  std::string out = "@";
  for (char c : name) {
    out.push_back(c == ' ' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::string ResolveUserIdentity(const std::filesystem::path& worktree_root) {
  if (auto name = Git(worktree_root, {"config", "user.name"})) {
    return NormalizeIdentity(*name);
  }
  if (const char* user = std::getenv("USER")) {
    if (*user != '\0') return NormalizeIdentity(user);
  }
  return NormalizeIdentity("unknown");
}

EventContext ResolveEventContext(const std::filesystem::path& worktree_root, const LogLayout& layout) {
  EventContext ctx;
  ctx.set_session_id(ResolveSessionId(layout.SessionFile(worktree_root)));
  if (auto harness = ResolveHarnessSessionId()) ctx.set_harness_session_id(*harness);

  auto git = ResolveGitContext(worktree_root);
  if (git.branch) ctx.set_branch(*git.branch);
  if (git.worktree) ctx.set_worktree(*git.worktree);
  if (git.commit) ctx.set_commit(*git.commit);
  return ctx;
}

util::Result AuditContext::Record(AuditEvent event) const {
  if (!writer) {
    return util::Result::Err(util::ErrorCode::InternalError, "audit context has no writer");
  }

  *event.mutable_ctx() = event_context;
  if (event.by().empty()) event.set_by(user);

  auto result = writer->Append(event);
  if (!result) {
    if (fail_on_append_error) {
      util::ThrowIfError(result, "audit append");
    }
    ITO_LOG_WARN("audit event not recorded",
                 {StringField("entity", event.entity()), StringField("entity_id", event.entity_id()),
                  StringField("code", util::ToString(result.code)), StringField("error", result.message)});
  }
  return result;
}

} // namespace ito::audit
