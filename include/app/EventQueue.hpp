#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "model/Event.hpp"

namespace vigil::app {

enum class OverflowPolicy { DropOldest, Block };

[[nodiscard]] auto parse_overflow_policy(const std::string& s) -> OverflowPolicy;

struct QueueOptions {
  size_t capacity{100};
  OverflowPolicy policy{OverflowPolicy::DropOldest};
  std::chrono::milliseconds enqueue_timeout{250};  // Block policy only
  int max_retries{5};                               // failed deliveries before an event is dropped
};

struct QueueStats {
  uint64_t enqueued{};
  uint64_t dropped_overflow{};   // DropOldest evictions
  uint64_t rejected_timeout{};   // Block policy gave up waiting
  uint64_t dropped_retries{};    // exceeded max_retries
  uint64_t deduplicated{};       // same dedup key already pending
  uint64_t requeued{};
};

// Bounded FIFO between detection and delivery. Many producers, one consumer.
class EventQueue {
public:
  explicit EventQueue(QueueOptions opts);

  // Returns false if the event was not queued (Block timeout or closed).
  // Never waits longer than the configured timeout.
  bool enqueue(vigil::model::Event e);

  // Removes up to max_n events from the head, oldest first
  [[nodiscard]] std::vector<vigil::model::Event> drain_batch(size_t max_n);

  // Puts a failed batch back at the head in its original order
  void requeue_front(std::vector<vigil::model::Event> batch);

  // Called (outside the lock) each time size reaches n after an enqueue
  void set_watermark(size_t n, std::function<void()> fn);

  // Wakes blocked producers; later enqueues are rejected
  void close();

  [[nodiscard]] size_t size() const;
  [[nodiscard]] size_t capacity() const { return opts_.capacity; }
  [[nodiscard]] QueueStats stats() const;

private:
  void forget_key_locked(const vigil::model::Event& e);
  void evict_oldest_locked();

  QueueOptions opts_;
  mutable std::mutex mu_;
  std::condition_variable not_full_;
  std::deque<vigil::model::Event> q_;
  std::unordered_map<std::string, int> pending_keys_;
  QueueStats stats_{};
  bool closed_{false};
  size_t watermark_{0};
  std::function<void()> on_watermark_{};
};

} // namespace vigil::app
