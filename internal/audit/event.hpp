#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ito/audit/v1/event.pb.h"
#include "internal/util/time.hpp"

namespace ito::audit {

/*
  Audit event model.

  The record itself is the generated ito::audit::v1::AuditEvent message;
  its JSON form (one object per line) is the on-disk format. This header
  adds the schema version, well-known names, entity keys, the line codec
  and a builder that enforces required fields.
*/

using AuditEvent   = ito::audit::v1::AuditEvent;
using EventContext = ito::audit::v1::EventContext;

// Bumped only on breaking changes to the record layout.
inline constexpr uint32_t kSchemaVersion = 1;

namespace entities {
inline constexpr const char* kTask     = "task";
inline constexpr const char* kChange   = "change";
inline constexpr const char* kModule   = "module";
inline constexpr const char* kWave     = "wave";
inline constexpr const char* kPlanning = "planning";
inline constexpr const char* kConfig   = "config";
} // namespace entities

namespace actors {
inline constexpr const char* kCli       = "cli";
inline constexpr const char* kReconcile = "reconcile";
inline constexpr const char* kRalph     = "ralph";
inline constexpr const char* kAgent     = "agent";
} // namespace actors

namespace ops {
inline constexpr const char* kCreate          = "create";
inline constexpr const char* kStatusChange    = "status_change";
inline constexpr const char* kAdd             = "add";
inline constexpr const char* kArchive         = "archive";
inline constexpr const char* kChangeAdded     = "change_added";
inline constexpr const char* kChangeCompleted = "change_completed";
inline constexpr const char* kUnlock          = "unlock";
inline constexpr const char* kDecision        = "decision";
inline constexpr const char* kBlocker         = "blocker";
inline constexpr const char* kQuestion        = "question";
inline constexpr const char* kNote            = "note";
inline constexpr const char* kFocusChange     = "focus_change";
inline constexpr const char* kSet             = "set";
inline constexpr const char* kUnset           = "unset";
inline constexpr const char* kReconciled      = "reconciled";
} // namespace ops

/*
  (entity, entity_id, scope) identifies one tracked thing.
  Ordered so maps keyed by it iterate deterministically.
*/
struct EntityKey {
  std::string                entity;
  std::string                entity_id;
  std::optional<std::string> scope;

  bool operator==(const EntityKey& other) const {
    return entity == other.entity && entity_id == other.entity_id && scope == other.scope;
  }
  bool operator!=(const EntityKey& other) const {
    return !(*this == other);
  }
  bool operator<(const EntityKey& other) const;

  // "task/1.1 (scope: ch)" or "config/x (scope: -)"
  std::string ToString() const;
};

EntityKey KeyOf(const AuditEvent& event);

std::optional<std::string> FromValue(const AuditEvent& event);
std::optional<std::string> ToValue(const AuditEvent& event);

// Empty string when the event carries every required field, else a description.
std::string MissingRequiredField(const AuditEvent& event);

/*
  Serialize to a single JSON line without the trailing newline.
  Throws util::ParseError if the event cannot be represented as JSON.
*/
std::string SerializeEvent(const AuditEvent& event);

/*
  Decode one log line.

  Unknown JSON keys are ignored. Throws util::SchemaVersionError when the
  version is not kSchemaVersion and util::ParseError for anything else
  (invalid JSON, wrong types, missing required fields).
*/
AuditEvent ParseEventLine(std::string_view line);

bool SameEvent(const AuditEvent& a, const AuditEvent& b);

/*
  Builds events with v and ts filled in.

  Build() returns nullopt if entity, entity_id, op, actor, by or ctx was
  never set.
*/
class AuditEventBuilder {
 public:
  AuditEventBuilder& Entity(std::string entity);
  AuditEventBuilder& EntityId(std::string entity_id);
  AuditEventBuilder& Scope(std::string scope);
  AuditEventBuilder& Op(std::string op);
  AuditEventBuilder& From(std::string from);
  AuditEventBuilder& To(std::string to);
  AuditEventBuilder& Actor(std::string actor);
  AuditEventBuilder& By(std::string by);
  AuditEventBuilder& Meta(const google::protobuf::Value& meta);
  AuditEventBuilder& Context(const EventContext& ctx);
  // Defaults to util::Now() at Build() time.
  AuditEventBuilder& At(util::TimePoint when);

  std::optional<AuditEvent> Build() const;

 private:
  std::optional<std::string>             entity_;
  std::optional<std::string>             entity_id_;
  std::optional<std::string>             scope_;
  std::optional<std::string>             op_;
  std::optional<std::string>             from_;
  std::optional<std::string>             to_;
  std::optional<std::string>             actor_;
  std::optional<std::string>             by_;
  std::optional<google::protobuf::Value> meta_;
  std::optional<EventContext>            ctx_;
  std::optional<util::TimePoint>         at_;
};

} // namespace ito::audit
