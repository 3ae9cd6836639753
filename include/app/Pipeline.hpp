#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include "app/Classifier.hpp"
#include "app/EventQueue.hpp"
#include "collectors/ICollector.hpp"
#include "model/Snapshot.hpp"

namespace vigil::app {

struct PipelineStats {
  uint64_t cycles{};
  uint64_t poll_failures{};
  uint64_t classify_failures{};
  uint64_t events{};
  uint64_t duplicate_keys{};
};

// One category's cycle: poll -> diff -> classify -> enqueue. The previous
// snapshot lives here and is touched only by this pipeline's own task.
class Pipeline {
public:
  Pipeline(std::shared_ptr<vigil::collectors::ICollector> collector,
           std::shared_ptr<const DetectionRules> rules,
           std::shared_ptr<EventQueue> queue);

  // Never throws. Returns false when the poll failed; the previous snapshot
  // is then kept as is. After stop_collector() it returns false without polling.
  bool run_cycle(std::stop_token st);

  // Stops the collector, or defers the stop until the cycle in flight
  // returns so stop() and poll() never overlap. Returns false when deferred.
  bool stop_collector();

  [[nodiscard]] const char* name() const { return collector_->name(); }
  [[nodiscard]] vigil::model::Category category() const { return collector_->category(); }
  [[nodiscard]] bool has_baseline() const { return have_previous_; }
  [[nodiscard]] size_t previous_size() const { return previous_.size_of(category()); }
  [[nodiscard]] PipelineStats stats() const;

private:
  bool poll_and_process(std::stop_token st);
  void stop_collector_now();
  void process_delta(const vigil::model::SnapshotSet& current);
  void emit(const Verdict& v, std::string message, nlohmann::json details, std::string dedup_key);
  template <typename Fn>
  Verdict safe_classify(const char* what, Fn&& fn);

  std::shared_ptr<vigil::collectors::ICollector> collector_;
  std::shared_ptr<const DetectionRules> rules_;
  std::shared_ptr<EventQueue> queue_;
  vigil::model::SnapshotSet previous_{};
  bool have_previous_{false};

  std::mutex cycle_mu_;
  bool in_cycle_{false};
  bool stop_deferred_{false};
  bool closed_{false};

  std::atomic<uint64_t> cycles_{0};
  std::atomic<uint64_t> poll_failures_{0};
  std::atomic<uint64_t> classify_failures_{0};
  std::atomic<uint64_t> events_{0};
  std::atomic<uint64_t> duplicate_keys_{0};
};

} // namespace vigil::app
