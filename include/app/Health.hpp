#pragma once
#include <string>
#include "model/Host.hpp"

namespace vigil::app {

struct HealthRules {
  double warning_pct = 80.0;
  double error_pct   = 90.0;
};

// "error" if cpu, memory or disk exceeds error_pct, "warning" above
// warning_pct, otherwise "active"
[[nodiscard]] auto heartbeat_status(const vigil::model::SystemMetrics& m, const HealthRules& rules = {}) -> std::string;

} // namespace vigil::app
