#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/event.hpp"

namespace ito::audit {

/*
  State implied by a log.

  Replaying events in physical order, each key holds the last `to` it was
  given. An archive without `to` reads as "archived" and a reconciled
  event without `to` removes the key. Other events without `to` (notes,
  unlocks) keep the last known value, and a key that never had a value is
  absent.
*/
struct MaterializedState {
  std::map<EntityKey, std::string> values;
  std::size_t                      event_count{0};

  std::optional<std::string> ValueOf(const EntityKey& key) const;
};

inline constexpr const char* kArchivedValue = "archived";

MaterializedState MaterializeState(const std::vector<AuditEvent>& events);

} // namespace ito::audit
