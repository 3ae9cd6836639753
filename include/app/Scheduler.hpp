#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/Clock.hpp"

namespace vigil::app {

struct TaskStats {
  uint64_t runs{};
  uint64_t skipped_slots{};   // slots missed because a cycle overran
  uint64_t failures{};        // cycles that threw
};

// Runs each registered task on its own thread at a fixed interval measured
// from cycle start. A cycle never overlaps its own next slot; missed slots
// are skipped, not queued. Tasks receive a stop_token for cancellation.
class Scheduler {
public:
  using TaskFn = std::function<void(std::stop_token)>;

  explicit Scheduler(std::shared_ptr<Clock> clock);
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Only before start()
  void add_task(std::string name, std::chrono::milliseconds interval, TaskFn fn, bool run_immediately = true);

  void start();

  // Signals every task and waits up to grace for them to finish. Tasks still
  // running afterwards are detached and exit at their next cancellation
  // check. Returns true if all tasks finished in time. Idempotent.
  bool stop(std::chrono::milliseconds grace);

  // Wakes a sleeping task so it runs its next cycle now
  void trigger(const std::string& name);

  [[nodiscard]] TaskStats stats(const std::string& name) const;
  [[nodiscard]] bool running() const { return running_; }
  [[nodiscard]] size_t task_count() const { return tasks_.size(); }

private:
  struct Task {
    std::string name;
    std::chrono::milliseconds interval;
    TaskFn fn;
    bool run_immediately{true};
    std::atomic<bool> triggered{false};
    std::atomic<uint64_t> runs{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<uint64_t> failures{0};
    std::jthread thread{};
  };
  // Shared with task threads so a detached straggler never outlives it
  struct Completion {
    std::mutex mu;
    std::condition_variable cv;
    int active{0};
  };

  static void run_task(Clock& clock, Task& t, Completion& done, std::stop_token st);

  std::shared_ptr<Clock> clock_;
  std::vector<std::shared_ptr<Task>> tasks_;
  std::shared_ptr<Completion> done_;
  bool running_{false};
};

} // namespace vigil::app
