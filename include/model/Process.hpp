#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vigil::model {

enum class SigningStatus { Unknown, Signed, Unsigned, Invalid };

[[nodiscard]] const char* to_string(SigningStatus s);

struct ProcessItem {
  int32_t pid{};
  int32_t ppid{};
  uint32_t uid{};
  uint64_t start_time{};   // clock ticks since boot
  uint64_t rss_kb{};
  uint64_t exe_size{};     // bytes, 0 if unreadable
  double   cpu_pct{};      // percent of one core, may exceed 100
  SigningStatus signing{SigningStatus::Unknown};
  std::string name;
  std::string exe_path;
  std::string user;
  std::string cmdline;
};

} // namespace vigil::model
