#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/audit/event.hpp"

namespace ito::audit {

struct AuditStats {
  std::size_t                        total{0};
  std::map<std::string, std::size_t> by_entity;
  std::map<std::string, std::size_t> by_op;
  std::map<std::string, std::size_t> by_actor;
  std::map<std::string, std::size_t> by_scope; // events without scope are not counted here
  std::optional<std::string>         first_ts;
  std::optional<std::string>         last_ts;
};

AuditStats ComputeStats(const std::vector<AuditEvent>& events);

} // namespace ito::audit
