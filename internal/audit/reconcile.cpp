#include "reconcile.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ito::audit {

using ito::observability::IntField;
using ito::observability::StringField;

namespace {

std::string Quoted(const std::optional<std::string>& value) {
  return value ? "'" + *value + "'" : std::string("<none>");
}

std::string Reason(const DriftEntry& entry) {
  const auto& key = entry.key;
  switch (entry.kind) {
    case DriftKind::Diverged:
      return key.entity + " '" + key.entity_id + "' audit status " + Quoted(entry.log_value) + " differs from file status " +
             Quoted(entry.file_value);
    case DriftKind::Unlogged:
      return key.entity + " '" + key.entity_id + "' has file status " + Quoted(entry.file_value) + " but no audit events";
    case DriftKind::Orphaned:
      return key.entity + " '" + key.entity_id + "' has audit status " + Quoted(entry.log_value) + " but no file entry";
  }
  return {};
}

} // namespace

bool FileState::Covers(const EntityKey& key) const {
  if (!scanned_entities.empty() && scanned_entities.count(key.entity) == 0) return false;
  if (key.scope && excluded_scopes.count(*key.scope) > 0) return false;
  return true;
}

FileState BuildFileState(const std::vector<EntityStateSourcePtr>& sources) {
  FileState merged;

  for (const auto& source : sources) {
    FileState part;
    try {
      source->Collect(&part);
    } catch (const util::ReconcileInputError&) {
      throw;
    } catch (const std::exception& ex) {
      throw util::ReconcileInputError(source->Name() + ": " + ex.what());
    }

    for (auto& [key, value] : part.values) {
      auto [it, inserted] = merged.values.emplace(key, value);
      if (!inserted && it->second != value) {
        throw util::ReconcileInputError(source->Name() + ": conflicting value for " + key.ToString() + ": '" + it->second +
                                        "' vs '" + value + "'");
      }
    }
    merged.scanned_entities.insert(part.scanned_entities.begin(), part.scanned_entities.end());
    merged.excluded_scopes.insert(part.excluded_scopes.begin(), part.excluded_scopes.end());

    ITO_LOG_DEBUG("file state collected", {StringField("source", source->Name()), IntField("keys", static_cast<int64_t>(part.values.size()))});
  }

  return merged;
}

const char* ToString(DriftKind kind) {
  switch (kind) {
    case DriftKind::Diverged:
      return "diverged";
    case DriftKind::Unlogged:
      return "unlogged";
    case DriftKind::Orphaned:
      return "orphaned";
  }
  return "unknown";
}

std::string DriftEntry::Describe() const {
  return std::string(ToString(kind)) + ": " + key.ToString() + " log=" + Quoted(log_value) + " file=" + Quoted(file_value);
}

ReconcileReport RunReconcile(const std::vector<AuditEvent>& events, const FileState& file_state, const ReconcileOptions& options) {
  ReconcileReport report;
  report.events_considered = events.size();

  auto log_state = MaterializeState(events);

  for (const auto& [key, file_value] : file_state.values) {
    auto it = log_state.values.find(key);
    if (it == log_state.values.end()) {
      report.drift.push_back({key, std::nullopt, file_value, DriftKind::Unlogged});
    } else if (it->second != file_value) {
      report.drift.push_back({key, it->second, file_value, DriftKind::Diverged});
    }
  }

  for (const auto& [key, log_value] : log_state.values) {
    if (file_state.values.count(key) > 0) continue;
    if (log_value.empty()) continue;
    if (!file_state.Covers(key)) continue;
    if (!options.orphan_entities.empty() && options.orphan_entities.count(key.entity) == 0) continue;
    report.drift.push_back({key, log_value, std::nullopt, DriftKind::Orphaned});
  }

  std::sort(report.drift.begin(), report.drift.end(), [](const DriftEntry& a, const DriftEntry& b) { return a.key < b.key; });
  return report;
}

std::vector<AuditEvent> GenerateCompensatingEvents(const std::vector<DriftEntry>& drift, const EventContext& ctx) {
  std::vector<AuditEvent> events;
  events.reserve(drift.size());

  for (const auto& entry : drift) {
    google::protobuf::Value meta;
    (*meta.mutable_struct_value()->mutable_fields())["reason"].set_string_value(Reason(entry));

    AuditEventBuilder builder;
    builder.Entity(entry.key.entity)
        .EntityId(entry.key.entity_id)
        .Op(ops::kReconciled)
        .Actor(actors::kReconcile)
        .By("@reconcile")
        .Meta(meta)
        .Context(ctx);
    if (entry.key.scope) builder.Scope(*entry.key.scope);
    if (entry.log_value) builder.From(*entry.log_value);
    if (entry.file_value) builder.To(*entry.file_value);

    auto event = builder.Build();
    if (!event) {
      throw util::InvalidArgument("compensating event incomplete for " + entry.key.ToString());
    }
    events.push_back(std::move(*event));
  }
  return events;
}

} // namespace ito::audit
