#include "minitest.hpp"
#include "fakes.hpp"
#include "fixtures.hpp"
#include "app/Agent.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using namespace vigil::app;
using namespace vigil::model;
using fakes::FakeHostProbe;
using fakes::FakeTransport;
using fakes::ScriptedCollector;
using fixtures::wait_until;
using fixtures::write_file;
using nlohmann::json;

namespace {

struct Harness {
  std::filesystem::path root;
  std::string config_path;
  std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
  std::shared_ptr<FakeHostProbe> host = std::make_shared<FakeHostProbe>();
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
  CollectorList collectors;

  Harness(const std::string& name, json cfg) {
    root = fixtures::make_root(name);
    config_path = (root / "agent-config.json").string();
    if (!cfg.contains("serverUrl")) cfg["serverUrl"] = "http://collector.test";
    if (!cfg.contains("logFilePath")) cfg["logFilePath"] = (root / "agent.log").string();
    write_file(config_path, cfg.dump(2));
  }

  AgentDeps deps() {
    AgentDeps d;
    d.transport = transport;
    d.host = host;
    d.clock = clock;
    auto list = collectors;
    d.collectors = [list](const AgentConfig&){ return list; };
    d.setup_logging = false;
    return d;
  }
};

std::shared_ptr<ScriptedCollector> net_collector(uint16_t remote_port) {
  return std::make_shared<ScriptedCollector>("net", Category::Network, [remote_port](SnapshotSet& s, std::stop_token){
    s.connections.push_back(fakes::connection(remote_port));
    return true;
  });
}

size_t uploaded_events(const FakeTransport& t) {
  size_t n = 0;
  for (const auto& r : t.requests_to("/api/agents/data")) n += json::parse(r.body)["events"].size();
  return n;
}

} // namespace

TEST(agent_initialize_registers_and_persists_id) {
  Harness h("agent_register", json::object());
  h.transport->route("/api/agents/register", 200,
                     R"({"agentId":"agent-123","token":"tok","config":{"heartbeatInterval":30,"endpoints":{"data":"/v2/data","heartbeat":"/v2/hb"}}})");
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.state() == AgentState::Uninitialized);
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(a.state() == AgentState::Initialized);
  ASSERT_EQ(std::string("agent-123"), a.config().agent_id);
  ASSERT_EQ(30, a.config().heartbeat_interval);
  ASSERT_EQ(std::string("/v2/hb"), a.config().heartbeat_endpoint);

  auto saved = load_config(h.config_path);
  ASSERT_EQ(std::string("agent-123"), saved.agent_id);
  ASSERT_EQ(std::string("tok"), saved.token);
  ASSERT_EQ(std::string("/v2/data"), saved.data_endpoint);
  ASSERT_TRUE(!a.initialize());
}

TEST(agent_skips_registration_when_id_is_stored) {
  Harness h("agent_known", json{{"agentId", "agent-7"}});
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(h.transport->requests_to("/api/agents/register").empty());
  Agent b(h.config_path, h.deps());
  h.transport->route("/api/agents/register", 200, R"({"agentId":"agent-8"})");
  ASSERT_TRUE(b.initialize(true));
  ASSERT_EQ(std::string("agent-8"), b.config().agent_id);
}

TEST(agent_initialize_reports_errors) {
  Harness bad_cfg("agent_bad_cfg", json{{"scanInterval", 0}});
  Agent a(bad_cfg.config_path, bad_cfg.deps());
  ASSERT_TRUE(!a.initialize());
  ASSERT_TRUE(a.last_error().find("scanInterval") != std::string::npos);
  ASSERT_TRUE(a.state() == AgentState::Uninitialized);

  Harness refused("agent_refused", json::object());
  refused.transport->route("/api/agents/register", 403, R"({"error":"bad key"})");
  Agent b(refused.config_path, refused.deps());
  ASSERT_TRUE(!b.initialize());
  ASSERT_TRUE(b.last_error().find("HTTP 403") != std::string::npos);
  ASSERT_TRUE(!b.start());
}

TEST(agent_start_excludes_unavailable_collectors) {
  Harness h("agent_partial", json{{"agentId", "agent-1"}});
  auto broken = std::make_shared<ScriptedCollector>("broken", Category::Process,
                                                    [](SnapshotSet&, std::stop_token){ return true; }, false);
  auto net = net_collector(443);
  h.collectors = {broken, net};
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(a.start());
  ASSERT_TRUE(a.state() == AgentState::Running);
  ASSERT_EQ(1u, a.active_collectors());
  ASSERT_TRUE(wait_until([&]{ return net->poll_count.load() >= 1; }));
  ASSERT_EQ(0, broken->poll_count.load());
  a.stop();
  ASSERT_EQ(1, broken->stop_count.load());
  ASSERT_EQ(1, net->stop_count.load());
}

TEST(agent_start_fails_when_no_collector_starts) {
  Harness h("agent_none", json{{"agentId", "agent-1"}});
  auto a1 = std::make_shared<ScriptedCollector>("a", Category::Process, [](SnapshotSet&, std::stop_token){ return true; }, false);
  auto a2 = std::make_shared<ScriptedCollector>("b", Category::Network, [](SnapshotSet&, std::stop_token){ return true; }, false);
  h.collectors = {a1, a2};
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(!a.start());
  ASSERT_TRUE(a.last_error().find("no collector") != std::string::npos);
  ASSERT_EQ(1, a1->stop_count.load());
  ASSERT_EQ(1, a2->stop_count.load());
}

TEST(agent_end_to_end_detects_uploads_and_heartbeats) {
  Harness h("agent_e2e", json{{"agentId", "agent-1"}, {"token", "tok"}});
  auto net = net_collector(4444);
  h.collectors = {net};
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(a.start());
  // network pipeline and heartbeat run at once; upload waits for its interval
  ASSERT_TRUE(wait_until([&]{ return a.queue()->size() == 1; }));
  ASSERT_TRUE(wait_until([&]{ return h.transport->requests_to("/api/agents/heartbeat").size() == 1; }));
  auto hb = json::parse(h.transport->requests_to("/api/agents/heartbeat")[0].body);
  ASSERT_EQ(std::string("active"), hb["status"].get<std::string>());
  ASSERT_EQ(std::string("agent-1"), hb["agentId"].get<std::string>());

  // identical second poll adds nothing
  ASSERT_TRUE(h.clock->wait_for_sleepers(3, 2000ms));
  h.clock->advance(std::chrono::seconds(a.config().network_interval));
  ASSERT_TRUE(wait_until([&]{ return net->poll_count.load() == 2 && h.clock->sleepers() == 3; }));
  ASSERT_EQ(1u, a.queue()->size());

  h.clock->advance(std::chrono::seconds(a.config().data_upload_interval - a.config().network_interval));
  ASSERT_TRUE(wait_until([&]{ return uploaded_events(*h.transport) == 1; }));
  ASSERT_EQ(0u, a.queue()->size());
  auto body = json::parse(h.transport->requests_to("/api/agents/data")[0].body);
  ASSERT_EQ(std::string("agent-1"), body["agentId"].get<std::string>());
  ASSERT_EQ(std::string("network"), body["events"][0]["eventType"].get<std::string>());
  ASSERT_EQ(std::string("high"), body["events"][0]["severity"].get<std::string>());

  a.stop();
  ASSERT_TRUE(a.state() == AgentState::Stopped);
  a.stop();
  ASSERT_TRUE(a.state() == AgentState::Stopped);
}

TEST(agent_queue_watermark_triggers_upload) {
  Harness h("agent_watermark", json{{"agentId", "agent-1"}, {"uploadBatchSize", 1}});
  h.collectors = {net_collector(4444)};
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(a.start());
  // the clock never moves, so only the watermark can have started the upload
  ASSERT_TRUE(wait_until([&]{ return uploaded_events(*h.transport) == 1; }));
  a.stop();
}

TEST(agent_watermark_is_capped_by_queue_capacity) {
  Harness h("agent_watermark_cap", json{{"agentId", "agent-1"}, {"uploadBatchSize", 100}, {"maxStorageSize", 1}});
  h.collectors = {net_collector(4444)};
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(a.start());
  ASSERT_TRUE(wait_until([&]{ return uploaded_events(*h.transport) == 1; }));
  a.stop();
}

TEST(agent_stop_flushes_pending_events) {
  Harness h("agent_flush", json{{"agentId", "agent-1"}});
  h.collectors = {net_collector(31337)};
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(a.start());
  ASSERT_TRUE(wait_until([&]{ return a.queue()->size() == 1; }));
  ASSERT_EQ(0u, uploaded_events(*h.transport));
  a.stop();
  ASSERT_EQ(1u, uploaded_events(*h.transport));
}

TEST(agent_stop_during_poll_is_bounded) {
  Harness h("agent_slow_stop", json{{"agentId", "agent-1"}, {"stopGraceMs", 200}});
  auto entered = std::make_shared<std::atomic<bool>>(false);
  auto release = std::make_shared<std::atomic<bool>>(false);
  // one collector honours cancellation, the other ignores it until released
  auto polite = std::make_shared<ScriptedCollector>("polite", Category::Process, [](SnapshotSet&, std::stop_token st){
    while (!st.stop_requested()) std::this_thread::sleep_for(1ms);
    return false;
  });
  auto stubborn = std::make_shared<ScriptedCollector>("stubborn", Category::Network, [entered, release](SnapshotSet&, std::stop_token){
    entered->store(true);
    while (!release->load()) std::this_thread::sleep_for(1ms);
    return true;
  });
  h.collectors = {polite, stubborn};
  {
    Agent a(h.config_path, h.deps());
    ASSERT_TRUE(a.initialize());
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(wait_until([&]{ return entered->load() && polite->poll_count.load() == 1; }));
    auto t0 = std::chrono::steady_clock::now();
    a.stop();
    auto took = std::chrono::steady_clock::now() - t0;
    ASSERT_TRUE(took < 1500ms);
    ASSERT_TRUE(a.state() == AgentState::Stopped);
    ASSERT_EQ(1, polite->stop_count.load());
    // the stubborn poll is still running, so its collector is not stopped yet
    ASSERT_EQ(0, stubborn->stop_count.load());
  }
  h.collectors.clear();
  release->store(true);
  // the straggler stops its collector once the poll returns, then lets go of it
  ASSERT_TRUE(wait_until([&]{ return stubborn->stop_count.load() == 1 && stubborn.use_count() == 1; }));
  ASSERT_EQ(1, stubborn->poll_count.load());
  ASSERT_EQ(0, stubborn->stopped_during_poll.load());
  ASSERT_EQ(0, polite->stopped_during_poll.load());
}

TEST(agent_cancelled_scan_still_stops_and_flushes) {
  Harness h("agent_scan_cancel", json{{"agentId", "agent-1"}});
  auto col = net_collector(4444);
  h.collectors = {col};
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.initialize());
  std::stop_source src;
  src.request_stop();
  ASSERT_TRUE(a.scan_once(src.get_token()));
  ASSERT_EQ(0, col->poll_count.load());
  ASSERT_EQ(1, col->stop_count.load());
  ASSERT_TRUE(a.state() == AgentState::Stopped);
}

TEST(agent_scan_once_isolates_failing_collector) {
  Harness h("agent_scan", json{{"agentId", "agent-1"}});
  auto failing = std::make_shared<ScriptedCollector>("proc", Category::Process, [](SnapshotSet&, std::stop_token){
    return false;
  });
  auto thrower = std::make_shared<ScriptedCollector>("persist", Category::Persistence, [](SnapshotSet&, std::stop_token) -> bool {
    throw std::runtime_error("permission denied");
  });
  h.collectors = {failing, thrower, net_collector(6667)};
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(a.scan_once());
  ASSERT_TRUE(a.state() == AgentState::Stopped);
  ASSERT_EQ(1u, uploaded_events(*h.transport));
  ASSERT_EQ(1, failing->poll_count.load());
  ASSERT_EQ(1, thrower->stop_count.load());
}

TEST(agent_push_collectors_feed_the_queue) {
  Harness h("agent_push", json{{"agentId", "agent-1"}});
  auto watcher = std::make_shared<ScriptedCollector>("watcher", Category::Auth, [](SnapshotSet&, std::stop_token){ return true; });
  watcher->polling_ = false;
  h.collectors = {};
  Agent a(h.config_path, h.deps());
  ASSERT_TRUE(a.register_collector(watcher));
  ASSERT_TRUE(a.initialize());
  ASSERT_TRUE(a.start());
  ASSERT_EQ(1u, a.active_collectors());
  watcher->emit(make_event(EventType::Auth, Severity::Medium, "Failed login for root from 192.0.2.1",
                           json::object(), ""));
  ASSERT_EQ(1u, a.queue()->size());
  ASSERT_EQ(0, watcher->poll_count.load());
  ASSERT_TRUE(!a.register_collector(net_collector(443)));
  a.stop();
  ASSERT_EQ(1u, uploaded_events(*h.transport));
}

TEST(agent_builtin_collectors_follow_capabilities) {
  AgentConfig cfg;
  auto list = builtin_collectors(cfg);
  ASSERT_EQ(2u, list.size());
  ASSERT_EQ(std::string("process"), std::string(list[0]->name()));
  ASSERT_EQ(std::string("network"), std::string(list[1]->name()));
  cfg.capabilities = Capabilities{true, true, true, true, true, true, true};
  list = builtin_collectors(cfg);
  ASSERT_EQ(6u, list.size());
  cfg.capabilities = Capabilities{false, false, false, false, false, false, false};
  ASSERT_TRUE(builtin_collectors(cfg).empty());
}
