#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/audit/event.hpp"
#include "internal/audit/materialize.hpp"

namespace ito::audit {

/*
  Point-in-time view of the tracked files.

  `values` maps each key found on disk to its observed value. The coverage
  sets say which part of the key space the sources actually scanned, so a
  log-only key outside it is not mistaken for a deleted entity.
*/
struct FileState {
  std::map<EntityKey, std::string> values;
  std::set<std::string>            scanned_entities; // empty: every kind
  std::set<std::string>            excluded_scopes;

  bool Covers(const EntityKey& key) const;
};

/*
  Collaborator that knows how to read one kind of tracked file.
  Collect() throws on unreadable or unparseable input.
*/
class EntityStateSource {
 public:
  virtual ~EntityStateSource() = default;

  virtual std::string Name() const                = 0;
  virtual void        Collect(FileState* state) const = 0;
};

using EntityStateSourcePtr = std::shared_ptr<const EntityStateSource>;

/*
  Assemble the file state from every source.
  Throws util::ReconcileInputError if a source fails or two sources
  disagree on the value of a key.
*/
FileState BuildFileState(const std::vector<EntityStateSourcePtr>& sources);

enum class DriftKind {
  Diverged, // both sides know the key, values differ
  Unlogged, // on disk, never logged
  Orphaned  // logged with a value, gone from disk
};

const char* ToString(DriftKind kind);

struct DriftEntry {
  EntityKey                  key;
  std::optional<std::string> log_value;
  std::optional<std::string> file_value;
  DriftKind                  kind{DriftKind::Diverged};

  std::string Describe() const;
};

struct ReconcileReport {
  std::vector<DriftEntry> drift; // sorted by key
  std::size_t             events_considered{0};

  bool Clean() const {
    return drift.empty();
  }
};

struct ReconcileOptions {
  // Kinds eligible for Orphaned entries; empty: every kind the file state covers.
  std::set<std::string> orphan_entities;
};

/*
  Compare log-implied state with file state. Pure: reads nothing, writes
  nothing.
*/
ReconcileReport RunReconcile(const std::vector<AuditEvent>& events, const FileState& file_state, const ReconcileOptions& options = {});

/*
  One `reconciled` event per drift entry that, once appended, makes the
  log agree with the files.
*/
std::vector<AuditEvent> GenerateCompensatingEvents(const std::vector<DriftEntry>& drift, const EventContext& ctx);

} // namespace ito::audit
