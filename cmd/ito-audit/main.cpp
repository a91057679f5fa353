#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_defaults.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/log_file.hpp"
#include "internal/tasks/tasks_file_source.hpp"
#include "internal/util/errors.hpp"
#include "ito/audit/v1.hpp"

namespace audit = ito::audit;

using google::protobuf::Struct;
using google::protobuf::Value;

static volatile std::sig_atomic_t g_running = 1;

static void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  ito-audit [--config <config.yaml>] [--root <dir>] <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  log        [--entity E] [--id ID] [--scope S] [--op OP] [--actor A]\n"
            << "             [--since TS] [--until TS] [--all-worktrees] [--json]\n"
            << "  reconcile  [--change C] [--fix] [--json]\n"
            << "  validate   [--change C] [--json]\n"
            << "  stats      [--json]\n"
            << "  stream     [--follow] [--all-worktrees] [--last N] [--cursor C] [--json]\n"
            << "  worktrees  [--json]\n"
            << "  record     --entity E --id ID --op OP [--scope S] [--from V] [--to V]\n"
            << "             [--actor A] [--by @who] [--meta JSON]\n"
            << "\n"
            << "Exit status: 0 ok, 1 usage, 2 failure, 3 drift or invalid log\n";
}

namespace {

constexpr int kExitOk      = 0;
constexpr int kExitUsage   = 1;
constexpr int kExitFailure = 2;
constexpr int kExitDrift   = 3;

class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

const std::set<std::string> kFlags = {"--json", "--fix", "--follow", "--all-worktrees"};
const std::set<std::string> kValued = {"--entity", "--id",    "--scope", "--op",   "--actor", "--since", "--until",
                                       "--change", "--last",  "--cursor", "--from", "--to",   "--by",    "--meta"};

struct Args {
  std::optional<std::string>         config_path;
  std::filesystem::path              root{"."};
  std::string                        command;
  std::set<std::string>              flags;
  std::map<std::string, std::string> values;

  bool Flag(const std::string& name) const {
    return flags.count(name) > 0;
  }

  std::optional<std::string> Value(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) return std::nullopt;
    return it->second;
  }

  std::string Required(const std::string& name) const {
    auto value = Value(name);
    if (!value) throw UsageError(command + " requires " + name);
    return *value;
  }
};

Args ParseArgs(int argc, char** argv) {
  Args args;
  int  i = 1;

  for (; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "--root") {
      if (i + 1 >= argc) throw UsageError(arg + " requires a value");
      if (arg == "--config") {
        args.config_path = argv[++i];
      } else {
        args.root = argv[++i];
      }
      continue;
    }
    if (arg == "-h" || arg == "--help") throw UsageError("");
    break;
  }

  if (i >= argc) throw UsageError("missing command");
  args.command = argv[i++];

  for (; i < argc; ++i) {
    std::string arg = argv[i];
    if (kFlags.count(arg)) {
      args.flags.insert(arg);
    } else if (kValued.count(arg)) {
      if (i + 1 >= argc) throw UsageError(arg + " requires a value");
      args.values[arg] = argv[++i];
    } else {
      throw UsageError("unknown argument: " + arg);
    }
  }
  return args;
}

std::size_t ParseCount(const std::string& name, const std::string& text) {
  try {
    std::size_t used  = 0;
    auto        value = std::stoull(text, &used);
    if (used != text.size()) throw std::invalid_argument(text);
    return static_cast<std::size_t>(value);
  } catch (const std::logic_error&) {
    throw UsageError(name + " expects a non-negative integer, got '" + text + "'");
  }
}

ito::util::TimePoint ParseTime(const std::string& name, const std::string& text) {
  auto tp = ito::util::ParseIso8601(text);
  if (!tp) throw UsageError(name + " expects an RFC 3339 timestamp, got '" + text + "'");
  return *tp;
}

// ------------------------------------------------------------
// Output helpers
// ------------------------------------------------------------

void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = false;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("render json: " + std::string(status.message()));
  }
  std::cout << json << "\n";
}

Value EventValue(const audit::AuditEvent& event) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(audit::SerializeEvent(event), &value);
  if (!status.ok()) {
    throw std::runtime_error("render event: " + std::string(status.message()));
  }
  return value;
}

Value Str(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Value Num(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value OptStr(const std::optional<std::string>& s) {
  Value v;
  if (s) {
    v.set_string_value(*s);
  } else {
    v.set_null_value(google::protobuf::NULL_VALUE);
  }
  return v;
}

Value CountsValue(const std::map<std::string, std::size_t>& counts) {
  Value v;
  auto& fields = *v.mutable_struct_value()->mutable_fields();
  for (const auto& [name, count] : counts) fields[name] = Num(static_cast<double>(count));
  return v;
}

std::string HumanEvent(const audit::AuditEvent& event) {
  std::string line = event.ts() + "  " + event.entity() + "/" + event.entity_id();
  if (event.has_scope()) line += " [" + event.scope() + "]";
  line += "  " + event.op();
  if (event.has_from_state() || event.has_to_state()) {
    line += "  " + (event.has_from_state() ? event.from_state() : std::string("-")) + " -> " +
            (event.has_to_state() ? event.to_state() : std::string("-"));
  }
  line += "  " + event.actor() + " " + event.by();
  return line;
}

void WarnSkipped(const std::string& what, std::size_t malformed, std::size_t unsupported) {
  if (malformed > 0) std::cerr << "warning: " << what << ": skipped " << malformed << " malformed line(s)\n";
  if (unsupported > 0) std::cerr << "warning: " << what << ": skipped " << unsupported << " line(s) with unsupported schema version\n";
}

void WarnExcluded(const std::vector<audit::ExcludedWorktree>& excluded) {
  for (const auto& wt : excluded) {
    std::cerr << "warning: worktree " << wt.worktree.Id() << " excluded: " << wt.reason << "\n";
  }
}

void WarnFailedSources(const std::vector<audit::FailedSource>& failed) {
  for (const auto& source : failed) {
    std::cerr << "warning: " << source.label << ": audit log unreadable: " << source.reason << "\n";
  }
}

void PrintStreamEvents(const std::vector<audit::StreamEvent>& events, bool json, bool labelled) {
  for (const auto& se : events) {
    if (json) {
      Struct out;
      auto&  fields     = *out.mutable_fields();
      fields["source"]  = Str(se.source);
      fields["cursor"]  = Str(se.cursor.ToString());
      fields["event"]   = EventValue(se.event);
      PrintJson(out);
    } else if (labelled) {
      std::cout << "[" << se.source << "] " << HumanEvent(se.event) << "\n";
    } else {
      std::cout << HumanEvent(se.event) << "\n";
    }
  }
  std::cout.flush();
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int RunLog(const Args& args, const ito::factory::Application& app) {
  audit::EventFilter filter;
  filter.entity    = args.Value("--entity");
  filter.entity_id = args.Value("--id");
  filter.scope     = args.Value("--scope");
  filter.op        = args.Value("--op");
  filter.actor     = args.Value("--actor");
  if (auto since = args.Value("--since")) filter.since = ParseTime("--since", *since);
  if (auto until = args.Value("--until")) filter.until = ParseTime("--until", *until);

  const bool json = args.Flag("--json");

  if (args.Flag("--all-worktrees")) {
    auto aggregate = audit::AggregateWorktreeEvents(audit::DiscoverWorktrees(app.project_root), app.layout);
    WarnExcluded(aggregate.excluded);
    if (aggregate.skipped_lines > 0) std::cerr << "warning: skipped " << aggregate.skipped_lines << " unreadable line(s)\n";

    for (const auto& we : aggregate.events) {
      if (!filter.Matches(we.event)) continue;
      if (json) {
        Struct out;
        auto&  fields      = *out.mutable_fields();
        fields["worktree"] = Str(we.label);
        fields["event"]    = EventValue(we.event);
        PrintJson(out);
      } else {
        std::cout << "[" << we.label << "] " << HumanEvent(we.event) << "\n";
      }
    }
    return kExitOk;
  }

  auto result = audit::ReadFiltered(app.layout.LogPath(app.project_root), filter);
  if (result.file_missing) {
    std::cerr << "no audit log at " << app.layout.LogPath(app.project_root).string() << "\n";
    return kExitOk;
  }
  WarnSkipped("audit log", result.malformed_lines, result.unsupported_version_lines);

  for (const auto& event : result.events) {
    if (json) {
      std::cout << audit::SerializeEvent(event) << "\n";
    } else {
      std::cout << HumanEvent(event) << "\n";
    }
  }
  return kExitOk;
}

int RunReconcile(const Args& args, const ito::factory::Application& app) {
  auto change = args.Value("--change");
  auto read   = audit::ReadAll(app.layout.LogPath(app.project_root));
  WarnSkipped("audit log", read.malformed_lines, read.unsupported_version_lines);

  std::vector<audit::AuditEvent> events;
  if (change) {
    for (auto& event : read.events) {
      if (event.has_scope() && event.scope() == *change) events.push_back(std::move(event));
    }
  } else {
    events = std::move(read.events);
  }

  std::vector<audit::EntityStateSourcePtr> sources = app.state_sources;
  if (change) {
    sources = {std::make_shared<ito::tasks::TasksFileSource>(app.layout.StateDir(app.project_root), *change)};
  }

  auto file_state = audit::BuildFileState(sources);
  auto report     = audit::RunReconcile(events, file_state, app.reconcile_options);

  std::size_t written = 0;
  if (args.Flag("--fix") && !report.Clean()) {
    if (!app.audit.enabled) {
      throw std::runtime_error("cannot fix drift: audit log is disabled or the project is not initialised");
    }
    for (const auto& event : audit::GenerateCompensatingEvents(report.drift, app.audit.event_context)) {
      if (app.audit.Record(event)) ++written;
    }
  }

  if (args.Flag("--json")) {
    Struct out;
    auto&  fields = *out.mutable_fields();
    fields["scope"]          = Str(change.value_or("project"));
    fields["events"]         = Num(static_cast<double>(report.events_considered));
    fields["events_written"] = Num(static_cast<double>(written));
    auto* list               = fields["drift"].mutable_list_value();
    for (const auto& entry : report.drift) {
      Value item;
      auto& f        = *item.mutable_struct_value()->mutable_fields();
      f["kind"]      = Str(audit::ToString(entry.kind));
      f["entity"]    = Str(entry.key.entity);
      f["entity_id"] = Str(entry.key.entity_id);
      f["scope"]     = OptStr(entry.key.scope);
      f["log"]       = OptStr(entry.log_value);
      f["file"]      = OptStr(entry.file_value);
      *list->add_values() = item;
    }
    PrintJson(out);
  } else {
    for (const auto& entry : report.drift) std::cout << entry.Describe() << "\n";
    if (report.Clean()) {
      std::cout << "no drift (" << report.events_considered << " events)\n";
    } else if (args.Flag("--fix")) {
      std::cout << "wrote " << written << " of " << report.drift.size() << " compensating event(s)\n";
    } else {
      std::cout << report.drift.size() << " drift entr" << (report.drift.size() == 1 ? "y" : "ies") << "\n";
    }
  }

  if (report.Clean()) return kExitOk;
  if (args.Flag("--fix")) return written == report.drift.size() ? kExitOk : kExitFailure;
  return kExitDrift;
}

int RunValidate(const Args& args, const ito::factory::Application& app) {
  auto report = audit::ValidateLog(app.layout.LogPath(app.project_root), args.Value("--change"));

  if (args.Flag("--json")) {
    Struct out;
    auto&  fields        = *out.mutable_fields();
    fields["event_count"] = Num(static_cast<double>(report.event_count));
    fields["valid"].set_bool_value(report.Valid());
    auto* list = fields["issues"].mutable_list_value();
    for (const auto& issue : report.issues) {
      Value item;
      auto& f      = *item.mutable_struct_value()->mutable_fields();
      f["level"]   = Str(audit::ToString(issue.level));
      f["line"]    = Num(static_cast<double>(issue.index));
      f["message"] = Str(issue.message);
      *list->add_values() = item;
    }
    PrintJson(out);
  } else {
    for (const auto& issue : report.issues) {
      std::cout << audit::ToString(issue.level) << ": line " << issue.index << ": " << issue.message << "\n";
    }
    std::cout << report.event_count << " event(s), " << report.issues.size() << " issue(s)\n";
  }
  return report.Valid() ? kExitOk : kExitDrift;
}

int RunStats(const Args& args, const ito::factory::Application& app) {
  auto read = audit::ReadAll(app.layout.LogPath(app.project_root));
  WarnSkipped("audit log", read.malformed_lines, read.unsupported_version_lines);
  auto stats = audit::ComputeStats(read.events);

  if (args.Flag("--json")) {
    Struct out;
    auto&  fields       = *out.mutable_fields();
    fields["total"]     = Num(static_cast<double>(stats.total));
    fields["by_entity"] = CountsValue(stats.by_entity);
    fields["by_op"]     = CountsValue(stats.by_op);
    fields["by_actor"]  = CountsValue(stats.by_actor);
    fields["by_scope"]  = CountsValue(stats.by_scope);
    fields["first_ts"]  = OptStr(stats.first_ts);
    fields["last_ts"]   = OptStr(stats.last_ts);
    PrintJson(out);
    return kExitOk;
  }

  auto section = [](const char* title, const std::map<std::string, std::size_t>& counts) {
    std::cout << title << ":\n";
    for (const auto& [name, count] : counts) std::cout << "  " << name << ": " << count << "\n";
  };
  std::cout << "total: " << stats.total << "\n";
  if (stats.first_ts) std::cout << "range: " << *stats.first_ts << " .. " << *stats.last_ts << "\n";
  section("by entity", stats.by_entity);
  section("by op", stats.by_op);
  section("by actor", stats.by_actor);
  section("by scope", stats.by_scope);
  return kExitOk;
}

int RunWorktrees(const Args& args, const ito::factory::Application& app) {
  for (const auto& wt : audit::DiscoverWorktrees(app.project_root)) {
    auto log     = app.layout.LogPath(wt.path);
    bool has_log = ito::storage::Stat(log).exists;

    if (args.Flag("--json")) {
      Struct out;
      auto&  fields   = *out.mutable_fields();
      fields["path"]  = Str(wt.path.string());
      fields["branch"] = OptStr(wt.branch);
      fields["main"].set_bool_value(wt.is_main);
      fields["log"]   = Str(log.string());
      fields["has_log"].set_bool_value(has_log);
      PrintJson(out);
    } else {
      std::cout << wt.path.string() << "  " << wt.Label() << (wt.is_main ? "  (main)" : "") << (has_log ? "" : "  (no audit log)") << "\n";
    }
  }
  return kExitOk;
}

int RunStream(const Args& args, const ito::factory::Application& app, const ito::runtime::config::RuntimeConfig& config) {
  auto stream_config = audit::StreamConfig::FromSettings(config.stream());
  if (auto last = args.Value("--last")) stream_config.last = ParseCount("--last", *last);
  if (args.Flag("--all-worktrees")) stream_config.all_worktrees = true;
  if (auto cursor = args.Value("--cursor")) {
    stream_config.start_cursor = audit::StreamCursor::Parse(*cursor);
    if (!stream_config.start_cursor) throw UsageError("invalid --cursor: " + *cursor);
  }

  const bool json = args.Flag("--json");

  std::vector<audit::StreamSource> sources;
  auto initial = audit::ReadInitialSources(app.project_root, app.layout, stream_config, &sources);
  WarnFailedSources(initial.failed_sources);
  if (sources.empty()) {
    std::cerr << "no readable audit log to stream\n";
    return kExitFailure;
  }
  const bool labelled = sources.size() + initial.failed_sources.size() > 1;
  PrintStreamEvents(initial.events, json, labelled);
  if (initial.skipped_lines > 0) std::cerr << "warning: skipped " << initial.skipped_lines << " unreadable line(s)\n";

  if (!args.Flag("--follow")) {
    if (sources.size() == 1) std::cerr << "cursor: " << sources.front().cursor.ToString() << "\n";
    return kExitOk;
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  ITO_LOG_INFO("streaming audit events", {ito::observability::IntField("sources", static_cast<int64_t>(sources.size())),
                                          ito::observability::IntField("poll_ms", stream_config.poll_interval.count())});

  while (g_running) {
    std::this_thread::sleep_for(stream_config.poll_interval);
    if (!g_running) break;

    auto batch = audit::PollSources(&sources);
    for (const auto& label : batch.resynced_sources) {
      std::cerr << "warning: " << label << ": log truncated or replaced, resynchronized\n";
    }
    WarnFailedSources(batch.failed_sources);
    PrintStreamEvents(batch.events, json, labelled);
  }

  if (sources.size() == 1) std::cerr << "cursor: " << sources.front().cursor.ToString() << "\n";
  return kExitOk;
}

int RunRecord(const Args& args, const ito::factory::Application& app) {
  audit::AuditEventBuilder builder;
  builder.Entity(args.Required("--entity"))
      .EntityId(args.Required("--id"))
      .Op(args.Required("--op"))
      .Actor(args.Value("--actor").value_or(audit::actors::kCli))
      .By(args.Value("--by").value_or(app.audit.user))
      .Context(app.audit.event_context);
  if (auto scope = args.Value("--scope")) builder.Scope(*scope);
  if (auto from = args.Value("--from")) builder.From(*from);
  if (auto to = args.Value("--to")) builder.To(*to);
  if (auto meta = args.Value("--meta")) {
    Value value;
    if (!google::protobuf::util::JsonStringToMessage(*meta, &value).ok()) {
      throw UsageError("--meta is not valid JSON");
    }
    builder.Meta(value);
  }

  auto event = builder.Build();
  if (!event) throw UsageError("record: incomplete event");

  if (!app.audit.enabled) {
    std::cerr << "warning: audit log disabled or project not initialised, event discarded\n";
  }

  auto result = app.audit.Record(*event);
  if (!result) {
    std::cerr << "audit append failed: " << result.message << "\n";
    return kExitFailure;
  }
  if (args.Flag("--json")) {
    std::cout << audit::SerializeEvent(*event) << "\n";
  }
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  Args args;
  try {
    args = ParseArgs(argc, argv);
  } catch (const UsageError& e) {
    if (*e.what() != '\0') std::cerr << e.what() << "\n";
    Usage();
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = args.config_path ? ito::config::ConfigLoader::LoadFromYaml(*args.config_path) : ito::config::DefaultConfig();

    ito::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application
    // ------------------------------------------------------------
    std::error_code ec;
    auto            root = std::filesystem::absolute(args.root, ec);
    if (ec) root = args.root;

    const bool writes = args.command == "record" || (args.command == "reconcile" && args.Flag("--fix"));
    auto       app    = ito::factory::Build(config, root, writes ? ito::factory::AuditAccess::Write : ito::factory::AuditAccess::ReadOnly);

    int rc = kExitUsage;
    if (args.command == "log") {
      rc = RunLog(args, app);
    } else if (args.command == "reconcile") {
      rc = RunReconcile(args, app);
    } else if (args.command == "validate") {
      rc = RunValidate(args, app);
    } else if (args.command == "stats") {
      rc = RunStats(args, app);
    } else if (args.command == "stream") {
      rc = RunStream(args, app, config);
    } else if (args.command == "worktrees") {
      rc = RunWorktrees(args, app);
    } else if (args.command == "record") {
      rc = RunRecord(args, app);
    } else {
      std::cerr << "unknown command: " << args.command << "\n";
      Usage();
    }

    ito::observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    ito::observability::ShutdownLogging();
    return kExitUsage;
  } catch (const std::exception& e) {
    ITO_LOG_ERROR("Fatal error", {ito::observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << "\n";
    ito::observability::ShutdownLogging();
    return kExitFailure;
  }
}
