#include "app/Clock.hpp"

namespace vigil::app {

bool SteadyClock::sleep_until(time_point tp, std::stop_token st, const std::function<bool()>& wake) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_until(lk, st, tp, [&]{ return wake && wake(); });
  return !st.stop_requested();
}

void SteadyClock::notify() {
  std::lock_guard<std::mutex> lk(mu_);
  cv_.notify_all();
}

ManualClock::ManualClock() : now_(std::chrono::steady_clock::time_point{} + std::chrono::hours(1)) {}

Clock::time_point ManualClock::now() const {
  std::lock_guard<std::mutex> lk(mu_);
  return now_;
}

bool ManualClock::sleep_until(time_point tp, std::stop_token st, const std::function<bool()>& wake) {
  std::unique_lock<std::mutex> lk(mu_);
  ++sleepers_;
  cv_.notify_all();
  cv_.wait(lk, st, [&]{ return now_ >= tp || (wake && wake()); });
  --sleepers_;
  return !st.stop_requested();
}

void ManualClock::notify() {
  std::lock_guard<std::mutex> lk(mu_);
  cv_.notify_all();
}

void ManualClock::advance(duration d) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    now_ += d;
  }
  cv_.notify_all();
}

bool ManualClock::wait_for_sleepers(int n, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [&]{ return sleepers_ >= n; });
}

int ManualClock::sleepers() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sleepers_;
}

} // namespace vigil::app
