#include "minitest.hpp"
#include "fixtures.hpp"
#include "app/Config.hpp"
#include "app/Errors.hpp"
#include <fstream>
#include <string>

using namespace vigil::app;
using fixtures::ScopedEnv;
using fixtures::write_file;

static bool throws_config_error(const std::function<void()>& fn, const std::string& needle) {
  try {
    fn();
  } catch (const ConfigError& e) {
    return std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

TEST(config_defaults_are_valid) {
  AgentConfig c;
  validate_config(c);
  ASSERT_TRUE(c.capabilities.process_monitoring);
  ASSERT_TRUE(c.capabilities.network_monitoring);
  ASSERT_TRUE(!c.capabilities.file_system_monitoring);
  ASSERT_TRUE(!c.capabilities.vulnerability_scanning);
  ASSERT_EQ(100, c.max_storage_size);
  ASSERT_EQ(std::string("drop-oldest"), c.queue_overflow_policy);
}

TEST(config_missing_file_writes_defaults) {
  auto root = fixtures::make_root("config_missing");
  auto path = (root / "conf/agent-config.json").string();
  auto c = load_config(path);
  ASSERT_TRUE(std::filesystem::exists(path));
  ASSERT_EQ(std::string("http://localhost:3000"), c.server_url);
  auto again = load_config(path);
  ASSERT_EQ(c.heartbeat_interval, again.heartbeat_interval);
}

TEST(config_reads_camel_case_keys) {
  auto root = fixtures::make_root("config_read");
  auto path = (root / "agent-config.json").string();
  write_file(path, R"({
    "serverUrl": "https://collector.example:8443",
    "agentId": "agent-7",
    "heartbeatInterval": 15,
    "scanInterval": 600,
    "capabilities": {"fileSystemMonitoring": true, "networkMonitoring": false},
    "directoriesToScan": ["/srv"],
    "queueOverflowPolicy": "block",
    "unknownKey": 42
  })");
  auto c = load_config(path);
  ASSERT_EQ(std::string("https://collector.example:8443"), c.server_url);
  ASSERT_EQ(std::string("agent-7"), c.agent_id);
  ASSERT_EQ(15, c.heartbeat_interval);
  ASSERT_EQ(600, c.scan_interval);
  ASSERT_EQ(300, c.data_upload_interval);
  ASSERT_TRUE(c.capabilities.file_system_monitoring);
  ASSERT_TRUE(!c.capabilities.network_monitoring);
  ASSERT_TRUE(c.capabilities.process_monitoring);
  ASSERT_EQ(1u, c.directories_to_scan.size());
  ASSERT_EQ(std::string("block"), c.queue_overflow_policy);
}

TEST(config_rejects_non_positive_intervals) {
  auto root = fixtures::make_root("config_bad_interval");
  auto path = (root / "agent-config.json").string();
  write_file(path, R"({"heartbeatInterval": 0})");
  ASSERT_TRUE(throws_config_error([&]{ (void)load_config(path); }, "heartbeatInterval"));
  AgentConfig c;
  c.network_interval = -5;
  ASSERT_TRUE(throws_config_error([&]{ validate_config(c); }, "networkInterval"));
  AgentConfig d;
  d.max_storage_size = 0;
  ASSERT_TRUE(throws_config_error([&]{ validate_config(d); }, "maxStorageSize"));
}

TEST(config_rejects_bad_values) {
  auto root = fixtures::make_root("config_bad_json");
  auto path = (root / "agent-config.json").string();
  write_file(path, "{ not json");
  ASSERT_TRUE(throws_config_error([&]{ (void)load_config(path); }, "not valid JSON"));
  write_file(path, R"({"heartbeatInterval": "often"})");
  ASSERT_TRUE(throws_config_error([&]{ (void)load_config(path); }, "invalid config value"));
  write_file(path, R"({"serverUrl": "ftp://collector"})");
  ASSERT_TRUE(throws_config_error([&]{ (void)load_config(path); }, "serverUrl"));
  write_file(path, R"({"queueOverflowPolicy": "spill"})");
  ASSERT_TRUE(throws_config_error([&]{ (void)load_config(path); }, "queueOverflowPolicy"));
  write_file(path, R"({"logLevel": "chatty"})");
  ASSERT_TRUE(throws_config_error([&]{ (void)load_config(path); }, "logLevel"));
}

TEST(config_environment_overrides_file) {
  auto root = fixtures::make_root("config_env");
  auto path = (root / "agent-config.json").string();
  write_file(path, R"({"serverUrl": "http://from-file:3000", "logLevel": "info"})");
  ScopedEnv url("VIGIL_SERVER_URL", "https://from-env");
  ScopedEnv level("VIGIL_LOG_LEVEL", "debug");
  auto c = load_config(path);
  ASSERT_EQ(std::string("https://from-env"), c.server_url);
  ASSERT_EQ(std::string("debug"), c.log_level);
}

TEST(config_save_round_trips_registration) {
  auto root = fixtures::make_root("config_save");
  auto path = (root / "agent-config.json").string();
  AgentConfig c;
  c.agent_id = "agent-99";
  c.token = "secret";
  c.data_endpoint = "/v2/data";
  save_config(c, path);
  auto back = load_config(path);
  ASSERT_EQ(std::string("agent-99"), back.agent_id);
  ASSERT_EQ(std::string("/v2/data"), back.data_endpoint);
}

TEST(config_endpoint_url_joins) {
  AgentConfig c;
  c.server_url = "http://collector:3000/";
  ASSERT_EQ(std::string("http://collector:3000/api/agents/data"), endpoint_url(c, "/api/agents/data"));
  ASSERT_EQ(std::string("http://collector:3000/hb"), endpoint_url(c, "hb"));
  ASSERT_EQ(std::string("https://other/x"), endpoint_url(c, "https://other/x"));
}
