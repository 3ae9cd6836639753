#pragma once
#include "collectors/ICollector.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

namespace vigil::collectors {

// Traditional /proc scanner
class ProcessCollector : public ICollector {
public:
  ProcessCollector() = default;
  bool poll(vigil::model::SnapshotSet& out, std::stop_token st) override;
  const char* name() const override { return "process"; }
  vigil::model::Category category() const override { return vigil::model::Category::Process; }

  struct StatFields {
    char state{'?'};
    int32_t ppid{};
    uint64_t utime{};
    uint64_t stime{};
    uint64_t start_time{};
    int64_t rss_pages{};
    std::string comm;
  };
  static bool parse_stat_line(const std::string& content, StatFields& out);

private:
  std::unordered_map<int32_t, uint64_t> last_per_proc_{}; // pid -> total_time
  std::unordered_map<uint32_t, std::string> users_{};     // uid -> name
  uint64_t last_cpu_total_{};
  bool have_last_{false};
  unsigned ncpu_{0};

  std::string user_name_cached(uint32_t uid);
};

} // namespace vigil::collectors
