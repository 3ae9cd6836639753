#include "app/Scheduler.hpp"

#include <spdlog/spdlog.h>

namespace vigil::app {

Scheduler::Scheduler(std::shared_ptr<Clock> clock) : clock_(std::move(clock)), done_(std::make_shared<Completion>()) {}

Scheduler::~Scheduler() { stop(std::chrono::milliseconds(2000)); }

void Scheduler::add_task(std::string name, std::chrono::milliseconds interval, TaskFn fn, bool run_immediately) {
  if (running_) {
    spdlog::error("Scheduler: cannot add task {} while running", name);
    return;
  }
  auto t = std::make_shared<Task>();
  t->name = std::move(name);
  t->interval = interval.count() > 0 ? interval : std::chrono::milliseconds(1);
  t->fn = std::move(fn);
  t->run_immediately = run_immediately;
  tasks_.push_back(std::move(t));
}

void Scheduler::run_task(Clock& clock, Task& t, Completion& done, std::stop_token st) {
  const auto interval = std::chrono::duration_cast<Clock::duration>(t.interval);
  auto next = clock.now();
  if (!t.run_immediately) next += interval;
  auto wake = [&t]{ return t.triggered.load(); };
  while (!st.stop_requested()) {
    if (!clock.sleep_until(next, st, wake)) break;
    t.triggered.store(false);
    if (st.stop_requested()) break;

    const auto cycle_start = clock.now();
    try {
      t.fn(st);
    } catch (const std::exception& e) {
      t.failures.fetch_add(1);
      spdlog::error("Scheduler: task {} failed: {}", t.name, e.what());
    }
    t.runs.fetch_add(1);

    const auto end = clock.now();
    next = cycle_start + interval;
    if (end >= next) {
      auto passed = (end - cycle_start) / interval;  // slots already behind us
      t.skipped.fetch_add(static_cast<uint64_t>(passed));
      next = cycle_start + (passed + 1) * interval;
      spdlog::warn("Scheduler: task {} overran its interval, skipped {} slot(s)", t.name, passed);
    }
  }
  std::lock_guard<std::mutex> lk(done.mu);
  --done.active;
  done.cv.notify_all();
}

void Scheduler::start() {
  if (running_) return;
  running_ = true;
  {
    std::lock_guard<std::mutex> lk(done_->mu);
    done_->active = static_cast<int>(tasks_.size());
  }
  for (auto& t : tasks_) {
    // The thread holds its own references to the clock, the task and the
    // completion record, so detaching it on a slow stop is safe.
    t->thread = std::jthread([clock = clock_, task = t, done = done_](std::stop_token st){
      run_task(*clock, *task, *done, st);
    });
  }
  spdlog::info("Scheduler: started {} task(s)", tasks_.size());
}

bool Scheduler::stop(std::chrono::milliseconds grace) {
  if (!running_) return true;
  running_ = false;
  for (auto& t : tasks_) t->thread.request_stop();
  clock_->notify();

  bool all_done = false;
  {
    std::unique_lock<std::mutex> lk(done_->mu);
    all_done = done_->cv.wait_for(lk, grace, [&]{ return done_->active <= 0; });
  }
  for (auto& t : tasks_) {
    if (!t->thread.joinable()) continue;
    if (all_done) {
      t->thread.join();
    } else {
      spdlog::warn("Scheduler: task {} did not stop within {}ms, detaching", t->name, grace.count());
      t->thread.detach();
    }
  }
  spdlog::info("Scheduler: stopped");
  return all_done;
}

void Scheduler::trigger(const std::string& name) {
  for (auto& t : tasks_) {
    if (t->name == name) t->triggered.store(true);
  }
  clock_->notify();
}

TaskStats Scheduler::stats(const std::string& name) const {
  for (const auto& t : tasks_) {
    if (t->name == name) return TaskStats{t->runs.load(), t->skipped.load(), t->failures.load()};
  }
  return {};
}

} // namespace vigil::app
