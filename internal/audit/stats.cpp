#include "stats.hpp"

namespace ito::audit {

AuditStats ComputeStats(const std::vector<AuditEvent>& events) {
  AuditStats stats;
  stats.total = events.size();

  for (const auto& event : events) {
    ++stats.by_entity[event.entity()];
    ++stats.by_op[event.op()];
    ++stats.by_actor[event.actor()];
    if (event.has_scope()) ++stats.by_scope[event.scope()];
  }

  if (!events.empty()) {
    stats.first_ts = events.front().ts();
    stats.last_ts  = events.back().ts();
  }
  return stats;
}

} // namespace ito::audit
