#include "event.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <tuple>

#include "internal/util/errors.hpp"

namespace ito::audit {

bool EntityKey::operator<(const EntityKey& other) const {
  return std::tie(entity, entity_id, scope) < std::tie(other.entity, other.entity_id, other.scope);
}

std::string EntityKey::ToString() const {
  return entity + "/" + entity_id + " (scope: " + scope.value_or("-") + ")";
}

EntityKey KeyOf(const AuditEvent& event) {
  EntityKey key;
  key.entity    = event.entity();
  key.entity_id = event.entity_id();
  if (event.has_scope()) {
    key.scope = event.scope();
  }
  return key;
}

std::optional<std::string> FromValue(const AuditEvent& event) {
  if (!event.has_from_state()) {
    return std::nullopt;
  }
  return event.from_state();
}

std::optional<std::string> ToValue(const AuditEvent& event) {
  if (!event.has_to_state()) {
    return std::nullopt;
  }
  return event.to_state();
}

std::string MissingRequiredField(const AuditEvent& event) {
  if (event.ts().empty()) return "ts";
  if (event.entity().empty()) return "entity";
  if (event.entity_id().empty()) return "entity_id";
  if (event.op().empty()) return "op";
  if (event.actor().empty()) return "actor";
  if (event.by().empty()) return "by";
  if (!event.has_ctx() || event.ctx().session_id().empty()) return "ctx.session_id";
  return {};
}

std::string SerializeEvent(const AuditEvent& event) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = false;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(event, &json, options);
  if (!status.ok()) {
    throw util::ParseError("serialize audit event: " + std::string(status.message()));
  }
  return json;
}

AuditEvent ParseEventLine(std::string_view line) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  AuditEvent event;
  auto       status = google::protobuf::util::JsonStringToMessage(std::string(line), &event, options);
  if (!status.ok()) {
    throw util::ParseError("malformed event: " + std::string(status.message()));
  }

  if (event.v() == 0) {
    throw util::ParseError("malformed event: missing schema version");
  }
  if (event.v() != kSchemaVersion) {
    throw util::SchemaVersionError("unsupported schema version " + std::to_string(event.v()), event.v());
  }

  auto missing = MissingRequiredField(event);
  if (!missing.empty()) {
    throw util::ParseError("malformed event: missing " + missing);
  }
  return event;
}

bool SameEvent(const AuditEvent& a, const AuditEvent& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

// ------------------------------------------------------------
// Builder
// ------------------------------------------------------------

AuditEventBuilder& AuditEventBuilder::Entity(std::string entity) {
  entity_ = std::move(entity);
  return *this;
}

AuditEventBuilder& AuditEventBuilder::EntityId(std::string entity_id) {
  entity_id_ = std::move(entity_id);
  return *this;
}

AuditEventBuilder& AuditEventBuilder::Scope(std::string scope) {
  scope_ = std::move(scope);
  return *this;
}

AuditEventBuilder& AuditEventBuilder::Op(std::string op) {
  op_ = std::move(op);
  return *this;
}

AuditEventBuilder& AuditEventBuilder::From(std::string from) {
  from_ = std::move(from);
  return *this;
}

AuditEventBuilder& AuditEventBuilder::To(std::string to) {
  to_ = std::move(to);
  return *this;
}

AuditEventBuilder& AuditEventBuilder::Actor(std::string actor) {
  actor_ = std::move(actor);
  return *this;
}

AuditEventBuilder& AuditEventBuilder::By(std::string by) {
  by_ = std::move(by);
  return *this;
}

AuditEventBuilder& AuditEventBuilder::Meta(const google::protobuf::Value& meta) {
  meta_ = meta;
  return *this;
}

AuditEventBuilder& AuditEventBuilder::Context(const EventContext& ctx) {
  ctx_ = ctx;
  return *this;
}

AuditEventBuilder& AuditEventBuilder::At(util::TimePoint when) {
  at_ = when;
  return *this;
}

std::optional<AuditEvent> AuditEventBuilder::Build() const {
  if (!entity_ || !entity_id_ || !op_ || !actor_ || !by_ || !ctx_) {
    return std::nullopt;
  }

  AuditEvent event;
  event.set_v(kSchemaVersion);
  event.set_ts(util::FormatIso8601Millis(at_.value_or(util::Now())));
  event.set_entity(*entity_);
  event.set_entity_id(*entity_id_);
  if (scope_) event.set_scope(*scope_);
  event.set_op(*op_);
  if (from_) event.set_from_state(*from_);
  if (to_) event.set_to_state(*to_);
  event.set_actor(*actor_);
  event.set_by(*by_);
  if (meta_) *event.mutable_meta() = *meta_;
  *event.mutable_ctx() = *ctx_;
  return event;
}

} // namespace ito::audit
