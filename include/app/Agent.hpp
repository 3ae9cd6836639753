#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>
#include "app/Clock.hpp"
#include "app/Config.hpp"
#include "app/EventQueue.hpp"
#include "app/HostProbe.hpp"
#include "app/Pipeline.hpp"
#include "app/Rules.hpp"
#include "app/Scheduler.hpp"
#include "app/ServerClient.hpp"
#include "app/Transport.hpp"
#include "app/Uploader.hpp"
#include "collectors/ICollector.hpp"

namespace vigil::app {

enum class AgentState { Uninitialized, Initialized, Running, Stopped };

[[nodiscard]] const char* to_string(AgentState s);

using CollectorList = std::vector<std::shared_ptr<vigil::collectors::ICollector>>;
using CollectorFactory = std::function<CollectorList(const AgentConfig&)>;

// Collectors for every enabled capability
[[nodiscard]] auto builtin_collectors(const AgentConfig& cfg) -> CollectorList;

// Anything left empty gets the production implementation
struct AgentDeps {
  std::shared_ptr<IHttpTransport> transport;
  std::shared_ptr<IHostProbe> host;
  std::shared_ptr<Clock> clock;
  CollectorFactory collectors;
  bool setup_logging{true};
};

class Agent {
public:
  explicit Agent(std::string config_path, AgentDeps deps = {});
  ~Agent();
  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // Loads and validates config, registers if there is no agent id yet (or
  // force_register), instantiates enabled collectors. Returns false on
  // ConfigError or RegistrationError; last_error() holds the reason.
  bool initialize(bool force_register = false);

  // Third-party collectors; only before start()
  bool register_collector(std::shared_ptr<vigil::collectors::ICollector> c);

  // Starts collectors (failures are excluded), scheduler, heartbeat and
  // upload. Fails only if collectors were enabled and none could start.
  bool start();

  // Scheduler first, then collectors in reverse start order, then one
  // best-effort flush. Safe to call repeatedly.
  void stop();

  // One detection cycle over every polling collector plus a flush. A stop
  // request cancels the remaining polls; collectors are still stopped and
  // the queue flushed.
  bool scan_once(std::stop_token st = {});

  [[nodiscard]] AgentState state() const { return state_.load(); }
  [[nodiscard]] const AgentConfig& config() const { return cfg_; }
  [[nodiscard]] const std::string& last_error() const { return last_error_; }
  [[nodiscard]] std::shared_ptr<EventQueue> queue() const { return queue_; }
  [[nodiscard]] size_t active_collectors() const;
  [[nodiscard]] const Scheduler* scheduler() const { return scheduler_.get(); }
  [[nodiscard]] std::vector<std::shared_ptr<Pipeline>> pipelines() const;

private:
  struct Slot {
    std::shared_ptr<vigil::collectors::ICollector> collector;
    std::shared_ptr<Pipeline> pipeline;
    bool started{false};
  };

  bool start_collectors();
  void stop_collectors();
  void flush();
  [[nodiscard]] std::chrono::milliseconds interval_for(vigil::model::Category c) const;

  std::string config_path_;
  AgentDeps deps_;
  AgentConfig cfg_{};
  std::string last_error_;
  std::atomic<AgentState> state_{AgentState::Uninitialized};
  mutable std::mutex mu_;

  std::shared_ptr<const DetectionRules> rules_;
  std::shared_ptr<EventQueue> queue_;
  std::shared_ptr<ServerClient> client_;
  std::shared_ptr<Uploader> uploader_;
  std::shared_ptr<Scheduler> scheduler_;
  std::vector<Slot> slots_;
};

} // namespace vigil::app
