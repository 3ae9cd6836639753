#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace vigil::app {

struct Capabilities {
  bool file_system_monitoring{false};
  bool process_monitoring{true};
  bool network_monitoring{true};
  bool registry_monitoring{false};      // persistence points on Linux
  bool security_logs_monitoring{false};
  bool malware_scanning{false};
  bool vulnerability_scanning{false};
};

struct AgentConfig {
  std::string server_url{"http://localhost:3000"};
  std::string registration_key;
  std::string agent_id;                 // empty until registered
  std::string token;

  // seconds
  int heartbeat_interval{60};
  int data_upload_interval{300};
  int scan_interval{3600};
  int process_interval{60};
  int network_interval{60};
  int persistence_interval{300};

  std::string registration_endpoint{"/api/agents/register"};
  std::string data_endpoint{"/api/agents/data"};
  std::string heartbeat_endpoint{"/api/agents/heartbeat"};

  Capabilities capabilities{};
  std::string log_file_path{"./logs/agent.log"};
  int max_storage_size{100};            // queue capacity, events
  std::string log_level{"info"};
  std::vector<std::string> directories_to_scan{"/tmp", "/var/tmp", "/dev/shm", "/home"};
  std::vector<std::string> suspicious_directories{"/tmp/", "/var/tmp/", "/dev/shm/"};

  double cpu_alert_threshold{90.0};
  int upload_batch_size{100};
  int max_delivery_retries{5};
  std::string queue_overflow_policy{"drop-oldest"};  // drop-oldest|block
  int enqueue_timeout_ms{250};
  int stop_grace_ms{2000};
  int request_timeout_seconds{30};
  int scan_depth{3};
  std::string auth_log_path{"/var/log/auth.log"};
};

// Keys absent from j keep their default. Throws ConfigError on wrong types.
[[nodiscard]] auto config_from_json(const nlohmann::json& j) -> AgentConfig;
[[nodiscard]] auto config_to_json(const AgentConfig& c) -> nlohmann::json;

// VIGIL_SERVER_URL, VIGIL_LOG_LEVEL, VIGIL_REGISTRATION_KEY
void apply_env_overrides(AgentConfig& c);

// Throws ConfigError naming the first offending field
void validate_config(const AgentConfig& c);

// Resolution: file -> environment -> compiled default. A missing file is
// created with defaults. Throws ConfigError on parse or validation failure.
[[nodiscard]] auto load_config(const std::string& path) -> AgentConfig;

// Throws ConfigError if the file cannot be written
void save_config(const AgentConfig& c, const std::string& path);

// Endpoints may be absolute URLs or paths relative to server_url
[[nodiscard]] auto endpoint_url(const AgentConfig& c, const std::string& endpoint) -> std::string;

} // namespace vigil::app
