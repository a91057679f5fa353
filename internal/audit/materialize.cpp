#include "materialize.hpp"

namespace ito::audit {

std::optional<std::string> MaterializedState::ValueOf(const EntityKey& key) const {
  auto it = values.find(key);
  if (it == values.end()) return std::nullopt;
  return it->second;
}

MaterializedState MaterializeState(const std::vector<AuditEvent>& events) {
  MaterializedState state;
  state.event_count = events.size();

  for (const auto& event : events) {
    if (event.has_to_state()) {
      state.values[KeyOf(event)] = event.to_state();
    } else if (event.op() == ops::kArchive) {
      state.values[KeyOf(event)] = kArchivedValue;
    } else if (event.op() == ops::kReconciled) {
      // reconcile found no file entry for this key
      state.values.erase(KeyOf(event));
    }
  }
  return state;
}

} // namespace ito::audit
