#pragma once
#include <cstdint>
#include <string>

namespace vigil::model {

struct SystemInfo {
  std::string hostname;
  std::string ip;          // primary non-loopback IPv4
  std::string os_name;
  std::string os_version;
  std::string kernel;
};

struct SystemMetrics {
  double   cpu_usage{};     // 0..100
  double   memory_usage{};  // 0..100
  double   disk_usage{};    // 0..100, root filesystem
  uint64_t uptime_s{};
  uint64_t process_count{};
  uint64_t connection_count{};
};

} // namespace vigil::model
