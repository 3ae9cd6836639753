#include "app/Agent.hpp"
#include "app/Errors.hpp"
#include "app/Health.hpp"
#include "collectors/AuthLogCollector.hpp"
#include "collectors/FsCollector.hpp"
#include "collectors/NetCollector.hpp"
#include "collectors/PackageCollector.hpp"
#include "collectors/PersistenceCollector.hpp"
#include "collectors/ProcessCollector.hpp"
#include "util/Log.hpp"

#include <spdlog/spdlog.h>

namespace vigil::app {

using vigil::collectors::ICollector;
using vigil::model::Category;

const char* to_string(AgentState s) {
  switch (s) {
    case AgentState::Uninitialized: return "uninitialized";
    case AgentState::Initialized: return "initialized";
    case AgentState::Running: return "running";
    case AgentState::Stopped: return "stopped";
  }
  return "unknown";
}

auto builtin_collectors(const AgentConfig& cfg) -> CollectorList {
  CollectorList out;
  const auto& caps = cfg.capabilities;
  if (caps.process_monitoring) out.push_back(std::make_shared<vigil::collectors::ProcessCollector>());
  if (caps.network_monitoring) out.push_back(std::make_shared<vigil::collectors::NetCollector>());
  if (caps.registry_monitoring) out.push_back(std::make_shared<vigil::collectors::PersistenceCollector>());
  if (caps.file_system_monitoring || caps.malware_scanning)
    out.push_back(std::make_shared<vigil::collectors::FsCollector>(cfg.directories_to_scan, cfg.scan_depth));
  if (caps.vulnerability_scanning) out.push_back(std::make_shared<vigil::collectors::PackageCollector>());
  if (caps.security_logs_monitoring) out.push_back(std::make_shared<vigil::collectors::AuthLogCollector>(cfg.auth_log_path));
  return out;
}

Agent::Agent(std::string config_path, AgentDeps deps)
  : config_path_(std::move(config_path)), deps_(std::move(deps)) {
  if (!deps_.host) deps_.host = std::make_shared<LinuxHostProbe>();
  if (!deps_.clock) deps_.clock = std::make_shared<SteadyClock>();
  if (!deps_.collectors) deps_.collectors = builtin_collectors;
}

Agent::~Agent() { stop(); }

bool Agent::initialize(bool force_register) {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ != AgentState::Uninitialized) {
    last_error_ = std::string("initialize() called in state ") + to_string(state_);
    return false;
  }
  try {
    cfg_ = load_config(config_path_);
  } catch (const ConfigError& e) {
    last_error_ = e.what();
    spdlog::error("Agent: configuration error: {}", e.what());
    return false;
  }
  if (deps_.setup_logging) vigil::util::init_logging(cfg_.log_level, cfg_.log_file_path);
  spdlog::info("Agent: configuration loaded from {}", config_path_);

  rules_ = std::make_shared<const DetectionRules>(rules_from_config(cfg_));
  QueueOptions qo;
  qo.capacity = static_cast<size_t>(cfg_.max_storage_size);
  qo.policy = parse_overflow_policy(cfg_.queue_overflow_policy);
  qo.enqueue_timeout = std::chrono::milliseconds(cfg_.enqueue_timeout_ms);
  qo.max_retries = cfg_.max_delivery_retries;
  queue_ = std::make_shared<EventQueue>(qo);

  if (!deps_.transport) deps_.transport = std::make_shared<CurlTransport>(cfg_.request_timeout_seconds);
  client_ = std::make_shared<ServerClient>(deps_.transport, cfg_);

  if (cfg_.agent_id.empty() || force_register) {
    try {
      auto r = client_->register_agent(deps_.host->system_info());
      cfg_.agent_id = r.agent_id;
      cfg_.token = r.token;
      if (r.heartbeat_interval && *r.heartbeat_interval > 0) cfg_.heartbeat_interval = *r.heartbeat_interval;
      if (r.data_endpoint) cfg_.data_endpoint = *r.data_endpoint;
      if (r.heartbeat_endpoint) cfg_.heartbeat_endpoint = *r.heartbeat_endpoint;
    } catch (const RegistrationError& e) {
      last_error_ = e.what();
      spdlog::error("Agent: registration failed: {}", e.what());
      return false;
    }
    try {
      save_config(cfg_, config_path_);
    } catch (const ConfigError& e) {
      // the id still works for this run
      spdlog::warn("Agent: could not persist registration: {}", e.what());
    }
  } else {
    spdlog::info("Agent: already registered as {}", cfg_.agent_id);
  }

  uploader_ = std::make_shared<Uploader>(queue_, client_, static_cast<size_t>(cfg_.upload_batch_size));

  CollectorList list;
  try {
    list = deps_.collectors(cfg_);
  } catch (const std::exception& e) {
    spdlog::error("Agent: building collectors failed: {}", e.what());
  }
  // collectors registered before initialize() keep their place after the built-ins
  std::vector<Slot> slots;
  for (auto& c : list) if (c) slots.push_back(Slot{std::move(c), nullptr, false});
  for (auto& s : slots_) slots.push_back(std::move(s));
  slots_ = std::move(slots);
  spdlog::info("Agent: {} collector(s) enabled", slots_.size());

  state_ = AgentState::Initialized;
  return true;
}

bool Agent::register_collector(std::shared_ptr<ICollector> c) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!c) return false;
  if (state_ != AgentState::Uninitialized && state_ != AgentState::Initialized) {
    spdlog::error("Agent: collector {} registered too late (state {})", c->name(), to_string(state_));
    return false;
  }
  spdlog::info("Agent: registered collector {}", c->name());
  slots_.push_back(Slot{std::move(c), nullptr, false});
  return true;
}

std::chrono::milliseconds Agent::interval_for(Category c) const {
  int secs = cfg_.scan_interval;
  switch (c) {
    case Category::Process: secs = cfg_.process_interval; break;
    case Category::Network: secs = cfg_.network_interval; break;
    case Category::Persistence: secs = cfg_.persistence_interval; break;
    case Category::File:
    case Category::Package:
    case Category::Auth: secs = cfg_.scan_interval; break;
  }
  return std::chrono::seconds(secs);
}

bool Agent::start_collectors() {
  auto q = queue_;
  size_t started = 0;
  for (auto& s : slots_) {
    s.collector->set_event_sink([q](vigil::model::Event e){ q->enqueue(std::move(e)); });
    bool ok = false;
    try {
      ok = s.collector->start();
    } catch (const std::exception& e) {
      spdlog::error("Agent: collector {} threw on start: {}", s.collector->name(), e.what());
    }
    if (!ok) {
      spdlog::warn("Agent: collector {} unavailable, excluded: {}", s.collector->name(), s.collector->last_error());
      continue;
    }
    s.started = true;
    ++started;
    if (s.collector->polls() && !s.pipeline) s.pipeline = std::make_shared<Pipeline>(s.collector, rules_, queue_);
  }
  return slots_.empty() || started > 0;
}

void Agent::stop_collectors() {
  for (auto it = slots_.rbegin(); it != slots_.rend(); ++it) {
    it->started = false;
    if (it->pipeline) {
      // a detached task may still be inside poll(); its pipeline stops the collector afterwards
      if (!it->pipeline->stop_collector())
        spdlog::warn("Agent: collector {} still polling, stop deferred until the poll returns", it->collector->name());
      continue;
    }
    try {
      it->collector->stop();
    } catch (const std::exception& e) {
      spdlog::error("Agent: collector {} threw on stop: {}", it->collector->name(), e.what());
    }
  }
}

void Agent::flush() {
  if (!uploader_ || cfg_.agent_id.empty()) return;
  const size_t pending = queue_->size();
  if (pending == 0) return;
  size_t sent = uploader_->upload_once(std::stop_token{});
  if (sent < pending) spdlog::warn("Agent: flush delivered {} of {} pending event(s)", sent, pending);
  else spdlog::info("Agent: flushed {} event(s)", sent);
}

bool Agent::start() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ != AgentState::Initialized) {
    last_error_ = std::string("start() called in state ") + to_string(state_);
    spdlog::error("Agent: {}", last_error_);
    return false;
  }
  if (!start_collectors()) {
    last_error_ = "no collector could be started";
    spdlog::error("Agent: {}", last_error_);
    stop_collectors();
    return false;
  }

  scheduler_ = std::make_shared<Scheduler>(deps_.clock);
  for (auto& s : slots_) {
    if (!s.started || !s.pipeline) continue;
    auto p = s.pipeline;
    scheduler_->add_task(s.collector->name(), interval_for(s.collector->category()),
                         [p](std::stop_token st){ p->run_cycle(st); });
  }
  auto client = client_;
  auto host = deps_.host;
  scheduler_->add_task("heartbeat", std::chrono::seconds(cfg_.heartbeat_interval),
                       [client, host](std::stop_token st){
                         auto m = host->metrics();
                         client->send_heartbeat(heartbeat_status(m), m, st);
                       });
  auto up = uploader_;
  scheduler_->add_task("upload", std::chrono::seconds(cfg_.data_upload_interval),
                       [up](std::stop_token st){ up->upload_once(st); }, false);
  std::weak_ptr<Scheduler> weak = scheduler_;
  queue_->set_watermark(static_cast<size_t>(cfg_.upload_batch_size), [weak]{
    if (auto s = weak.lock()) s->trigger("upload");
  });

  scheduler_->start();
  state_ = AgentState::Running;
  spdlog::info("Agent: running with {} active collector(s)", active_collectors());
  return true;
}

void Agent::stop() {
  std::lock_guard<std::mutex> lk(mu_);
  const auto s = state_.load();
  if (s == AgentState::Stopped) return;
  if (s == AgentState::Uninitialized) {
    state_ = AgentState::Stopped;
    return;
  }
  spdlog::info("Agent: stopping");
  if (scheduler_) {
    if (!scheduler_->stop(std::chrono::milliseconds(cfg_.stop_grace_ms)))
      spdlog::warn("Agent: some tasks were still running after {}ms", cfg_.stop_grace_ms);
    queue_->set_watermark(0, {});
  }
  stop_collectors();
  flush();
  state_ = AgentState::Stopped;
  auto qs = queue_->stats();
  spdlog::info("Agent: stopped (queued={} overflow={} retry_drops={} pending={})",
               qs.enqueued, qs.dropped_overflow, qs.dropped_retries, queue_->size());
}

bool Agent::scan_once(std::stop_token st) {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ != AgentState::Initialized) {
    last_error_ = std::string("scan_once() called in state ") + to_string(state_);
    spdlog::error("Agent: {}", last_error_);
    return false;
  }
  if (!start_collectors()) {
    last_error_ = "no collector could be started";
    spdlog::error("Agent: {}", last_error_);
    stop_collectors();
    state_ = AgentState::Stopped;
    return false;
  }
  size_t ok = 0, ran = 0;
  for (auto& s : slots_) {
    if (!s.started || !s.pipeline) continue;
    if (st.stop_requested()) {
      spdlog::info("Agent: scan cancelled before {}", s.collector->name());
      break;
    }
    ++ran;
    if (s.pipeline->run_cycle(st)) ++ok;
  }
  spdlog::info("Agent: scan complete, {}/{} collector(s) succeeded, {} event(s) queued", ok, ran, queue_->size());
  stop_collectors();
  flush();
  state_ = AgentState::Stopped;
  return true;
}

size_t Agent::active_collectors() const {
  size_t n = 0;
  for (const auto& s : slots_) if (s.started) ++n;
  return n;
}

std::vector<std::shared_ptr<Pipeline>> Agent::pipelines() const {
  std::vector<std::shared_ptr<Pipeline>> out;
  for (const auto& s : slots_) if (s.pipeline) out.push_back(s.pipeline);
  return out;
}

} // namespace vigil::app
