#include "app/EventQueue.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace vigil::app {

auto parse_overflow_policy(const std::string& s) -> OverflowPolicy {
  return s == "block" ? OverflowPolicy::Block : OverflowPolicy::DropOldest;
}

EventQueue::EventQueue(QueueOptions opts) : opts_(std::move(opts)) {
  if (opts_.capacity == 0) opts_.capacity = 1;
}

void EventQueue::forget_key_locked(const vigil::model::Event& e) {
  if (e.dedup_key.empty()) return;
  auto it = pending_keys_.find(e.dedup_key);
  if (it == pending_keys_.end()) return;
  if (--it->second <= 0) pending_keys_.erase(it);
}

void EventQueue::evict_oldest_locked() {
  forget_key_locked(q_.front());
  q_.pop_front();
  ++stats_.dropped_overflow;
}

bool EventQueue::enqueue(vigil::model::Event e) {
  std::function<void()> notify;
  {
    std::unique_lock<std::mutex> lk(mu_);
    if (closed_) return false;
    if (!e.dedup_key.empty() && pending_keys_.count(e.dedup_key)) {
      ++stats_.deduplicated;
      return true;
    }
    if (q_.size() >= opts_.capacity) {
      if (opts_.policy == OverflowPolicy::DropOldest) {
        evict_oldest_locked();
        spdlog::warn("EventQueue: full ({}), dropped oldest event", opts_.capacity);
      } else {
        bool room = not_full_.wait_for(lk, opts_.enqueue_timeout,
                                       [&]{ return closed_ || q_.size() < opts_.capacity; });
        if (!room || closed_) {
          ++stats_.rejected_timeout;
          spdlog::warn("EventQueue: full ({}), rejected event after {}ms", opts_.capacity, opts_.enqueue_timeout.count());
          return false;
        }
      }
    }
    if (!e.dedup_key.empty()) ++pending_keys_[e.dedup_key];
    q_.push_back(std::move(e));
    ++stats_.enqueued;
    if (watermark_ > 0 && q_.size() == watermark_) notify = on_watermark_;
  }
  if (notify) notify();
  return true;
}

std::vector<vigil::model::Event> EventQueue::drain_batch(size_t max_n) {
  std::vector<vigil::model::Event> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = std::min(max_n, q_.size());
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      forget_key_locked(q_.front());
      out.push_back(std::move(q_.front()));
      q_.pop_front();
    }
  }
  if (!out.empty()) not_full_.notify_all();
  return out;
}

void EventQueue::requeue_front(std::vector<vigil::model::Event> batch) {
  std::lock_guard<std::mutex> lk(mu_);
  // walk backwards so push_front restores the original order
  for (auto it = batch.rbegin(); it != batch.rend(); ++it) {
    if (++it->attempts > opts_.max_retries) {
      ++stats_.dropped_retries;
      spdlog::warn("EventQueue: dropping {} event after {} failed deliveries",
                   vigil::model::to_string(it->type), it->attempts);
      continue;
    }
    if (!it->dedup_key.empty()) ++pending_keys_[it->dedup_key];
    q_.push_front(std::move(*it));
    ++stats_.requeued;
  }
  // producers may have filled the queue meanwhile; the oldest go first
  while (q_.size() > opts_.capacity) evict_oldest_locked();
}

void EventQueue::set_watermark(size_t n, std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(mu_);
  // a threshold above capacity could never be reached
  watermark_ = std::min(n, opts_.capacity);
  on_watermark_ = std::move(fn);
}

void EventQueue::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  not_full_.notify_all();
}

size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}

QueueStats EventQueue::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

} // namespace vigil::app
