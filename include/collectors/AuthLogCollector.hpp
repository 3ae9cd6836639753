#pragma once
#include "collectors/ICollector.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace vigil::collectors {

// Tails the authentication log and pushes auth events as lines arrive.
// It has no snapshot of its own, so the scheduler never polls it.
class AuthLogCollector : public ICollector {
public:
  // Failures from one source address that raise a brute-force event
  static constexpr int kBruteForceThreshold = 5;
  // Failures older than this no longer count toward the threshold
  static constexpr std::chrono::minutes kBruteForceWindow{10};
  // Source addresses tracked at once; the least recently seen is evicted
  static constexpr size_t kMaxTrackedSources = 1024;

  explicit AuthLogCollector(std::string path, std::chrono::milliseconds tail_interval = std::chrono::milliseconds(1000));
  ~AuthLogCollector() override;

  bool start() override;
  bool poll(vigil::model::SnapshotSet& out, std::stop_token st) override;
  void stop() override;
  const char* name() const override { return "auth-log"; }
  vigil::model::Category category() const override { return vigil::model::Category::Auth; }
  bool polls() const override { return false; }

  // Reads lines appended since the last call and pushes events for them.
  // Returns the number of events pushed.
  int drain_once();

  [[nodiscard]] size_t tracked_sources() const { return sources_.size(); }

private:
  void run(std::stop_token st);
  using TimePoint = std::chrono::steady_clock::time_point;
  struct SourceFailures {
    std::deque<TimePoint> times;
    TimePoint last_seen{};
  };

  void handle_line(const std::string& line, int& pushed);
  // Returns the failure count when it reaches the threshold, else 0
  int record_failure(const std::string& ip, TimePoint now);
  void prune_sources(TimePoint now);

  std::string path_;
  std::chrono::milliseconds tail_interval_;
  uint64_t offset_{0};
  bool started_{false};
  std::unordered_map<std::string, SourceFailures> sources_{};
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::jthread thread_{};
};

} // namespace vigil::collectors
