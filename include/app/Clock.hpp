#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>

namespace vigil::app {

// Time source for the scheduler. Production uses the steady clock; tests
// drive a ManualClock so interval behavior is deterministic.
class Clock {
public:
  using time_point = std::chrono::steady_clock::time_point;
  using duration = std::chrono::steady_clock::duration;

  virtual ~Clock() = default;
  [[nodiscard]] virtual time_point now() const = 0;

  // Blocks until tp is reached or wake() becomes true. Returns false if st
  // was signalled first.
  virtual bool sleep_until(time_point tp, std::stop_token st, const std::function<bool()>& wake) = 0;

  // Re-evaluates every sleeper's wake predicate
  virtual void notify() = 0;
};

class SteadyClock : public Clock {
public:
  time_point now() const override { return std::chrono::steady_clock::now(); }
  bool sleep_until(time_point tp, std::stop_token st, const std::function<bool()>& wake) override;
  void notify() override;
private:
  std::mutex mu_;
  std::condition_variable_any cv_;
};

class ManualClock : public Clock {
public:
  ManualClock();
  time_point now() const override;
  bool sleep_until(time_point tp, std::stop_token st, const std::function<bool()>& wake) override;
  void notify() override;

  void advance(duration d);
  // Real-time wait until at least n threads are parked in sleep_until
  bool wait_for_sleepers(int n, std::chrono::milliseconds timeout);
  [[nodiscard]] int sleepers() const;

private:
  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  time_point now_;
  int sleepers_{0};
};

} // namespace vigil::app
