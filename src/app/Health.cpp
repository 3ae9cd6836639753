#include "app/Health.hpp"

#include <algorithm>

namespace vigil::app {

auto heartbeat_status(const vigil::model::SystemMetrics& m, const HealthRules& rules) -> std::string {
  const double worst = std::max({m.cpu_usage, m.memory_usage, m.disk_usage});
  if (worst > rules.error_pct) return "error";
  if (worst > rules.warning_pct) return "warning";
  return "active";
}

} // namespace vigil::app
