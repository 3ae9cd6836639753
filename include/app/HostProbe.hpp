#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include "model/Host.hpp"

namespace vigil::app {

// Platform hooks used by the agent for registration and heartbeat
class IHostProbe {
public:
  virtual ~IHostProbe() = default;
  [[nodiscard]] virtual vigil::model::SystemInfo system_info() = 0;
  [[nodiscard]] virtual vigil::model::SystemMetrics metrics() = 0;
};

class LinuxHostProbe : public IHostProbe {
public:
  vigil::model::SystemInfo system_info() override;
  vigil::model::SystemMetrics metrics() override;

  // NAME and VERSION (or VERSION_ID) from an os-release file body
  static void parse_os_release(const std::string& text, std::string& name, std::string& version);

private:
  double cpu_usage();

  std::mutex mu_;
  uint64_t last_total_{0};
  uint64_t last_idle_{0};
};

} // namespace vigil::app
