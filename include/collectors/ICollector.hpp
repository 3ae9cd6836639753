#pragma once
#include <functional>
#include <stop_token>
#include <string>
#include "model/Event.hpp"
#include "model/Snapshot.hpp"

namespace vigil::collectors {

using EventSink = std::function<void(vigil::model::Event)>;

// A probe producing one category's snapshot. Built-ins and third-party
// collectors implement this; the agent shares ownership with its pipelines.
class ICollector {
public:
  virtual ~ICollector() = default;

  // Acquire resources. Return false if unavailable (permissions, platform).
  // Must be idempotent. Default: available (no-op)
  [[nodiscard]] virtual bool start() { return true; }

  // Sample current state into out. Return false on failure and leave the
  // reason in last_error(). Should return promptly once st is signalled.
  [[nodiscard]] virtual bool poll(vigil::model::SnapshotSet& out, std::stop_token st) = 0;

  // Release resources. Called even when start() failed. Default: no-op
  virtual void stop() {}

  [[nodiscard]] virtual const char* name() const = 0;
  [[nodiscard]] virtual vigil::model::Category category() const = 0;

  // Push-only collectors (log watchers) are not given a poll task
  [[nodiscard]] virtual bool polls() const { return true; }

  // Events emitted outside the poll cycle go here, straight to the queue
  void set_event_sink(EventSink sink) { sink_ = std::move(sink); }

  [[nodiscard]] const std::string& last_error() const { return last_error_; }

protected:
  void push_event(vigil::model::Event e) const { if (sink_) sink_(std::move(e)); }
  void set_error(std::string msg) { last_error_ = std::move(msg); }
  void clear_error() { last_error_.clear(); }

private:
  EventSink sink_{};
  std::string last_error_{};
};

} // namespace vigil::collectors
