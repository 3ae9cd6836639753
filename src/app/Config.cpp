#include "app/Config.hpp"
#include "app/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace vigil::app {

using nlohmann::json;

static const char* getenv_nonempty(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  return nullptr;
}

template <typename T>
static void read_key(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return;
  out = it->get<T>();
}

static void read_capabilities(const json& j, Capabilities& c) {
  if (!j.is_object()) throw ConfigError("capabilities must be an object");
  read_key(j, "fileSystemMonitoring", c.file_system_monitoring);
  read_key(j, "processMonitoring", c.process_monitoring);
  read_key(j, "networkMonitoring", c.network_monitoring);
  read_key(j, "registryMonitoring", c.registry_monitoring);
  read_key(j, "securityLogsMonitoring", c.security_logs_monitoring);
  read_key(j, "malwareScanning", c.malware_scanning);
  read_key(j, "vulnerabilityScanning", c.vulnerability_scanning);
}

auto config_from_json(const json& j) -> AgentConfig {
  if (!j.is_object()) throw ConfigError("config root must be a JSON object");
  AgentConfig c;
  try {
    read_key(j, "serverUrl", c.server_url);
    read_key(j, "registrationKey", c.registration_key);
    read_key(j, "agentId", c.agent_id);
    read_key(j, "token", c.token);
    read_key(j, "heartbeatInterval", c.heartbeat_interval);
    read_key(j, "dataUploadInterval", c.data_upload_interval);
    read_key(j, "scanInterval", c.scan_interval);
    read_key(j, "processInterval", c.process_interval);
    read_key(j, "networkInterval", c.network_interval);
    read_key(j, "persistenceInterval", c.persistence_interval);
    read_key(j, "registrationEndpoint", c.registration_endpoint);
    read_key(j, "dataEndpoint", c.data_endpoint);
    read_key(j, "heartbeatEndpoint", c.heartbeat_endpoint);
    if (auto it = j.find("capabilities"); it != j.end() && !it->is_null()) read_capabilities(*it, c.capabilities);
    read_key(j, "logFilePath", c.log_file_path);
    read_key(j, "maxStorageSize", c.max_storage_size);
    read_key(j, "logLevel", c.log_level);
    read_key(j, "directoriesToScan", c.directories_to_scan);
    read_key(j, "suspiciousDirectories", c.suspicious_directories);
    read_key(j, "cpuAlertThreshold", c.cpu_alert_threshold);
    read_key(j, "uploadBatchSize", c.upload_batch_size);
    read_key(j, "maxDeliveryRetries", c.max_delivery_retries);
    read_key(j, "queueOverflowPolicy", c.queue_overflow_policy);
    read_key(j, "enqueueTimeoutMs", c.enqueue_timeout_ms);
    read_key(j, "stopGraceMs", c.stop_grace_ms);
    read_key(j, "requestTimeoutSeconds", c.request_timeout_seconds);
    read_key(j, "scanDepth", c.scan_depth);
    read_key(j, "authLogPath", c.auth_log_path);
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }
  return c;
}

auto config_to_json(const AgentConfig& c) -> json {
  return json{
    {"serverUrl", c.server_url},
    {"registrationKey", c.registration_key},
    {"agentId", c.agent_id},
    {"token", c.token},
    {"heartbeatInterval", c.heartbeat_interval},
    {"dataUploadInterval", c.data_upload_interval},
    {"scanInterval", c.scan_interval},
    {"processInterval", c.process_interval},
    {"networkInterval", c.network_interval},
    {"persistenceInterval", c.persistence_interval},
    {"registrationEndpoint", c.registration_endpoint},
    {"dataEndpoint", c.data_endpoint},
    {"heartbeatEndpoint", c.heartbeat_endpoint},
    {"capabilities", {
      {"fileSystemMonitoring", c.capabilities.file_system_monitoring},
      {"processMonitoring", c.capabilities.process_monitoring},
      {"networkMonitoring", c.capabilities.network_monitoring},
      {"registryMonitoring", c.capabilities.registry_monitoring},
      {"securityLogsMonitoring", c.capabilities.security_logs_monitoring},
      {"malwareScanning", c.capabilities.malware_scanning},
      {"vulnerabilityScanning", c.capabilities.vulnerability_scanning},
    }},
    {"logFilePath", c.log_file_path},
    {"maxStorageSize", c.max_storage_size},
    {"logLevel", c.log_level},
    {"directoriesToScan", c.directories_to_scan},
    {"suspiciousDirectories", c.suspicious_directories},
    {"cpuAlertThreshold", c.cpu_alert_threshold},
    {"uploadBatchSize", c.upload_batch_size},
    {"maxDeliveryRetries", c.max_delivery_retries},
    {"queueOverflowPolicy", c.queue_overflow_policy},
    {"enqueueTimeoutMs", c.enqueue_timeout_ms},
    {"stopGraceMs", c.stop_grace_ms},
    {"requestTimeoutSeconds", c.request_timeout_seconds},
    {"scanDepth", c.scan_depth},
    {"authLogPath", c.auth_log_path},
  };
}

void apply_env_overrides(AgentConfig& c) {
  if (const char* v = getenv_nonempty("VIGIL_SERVER_URL")) c.server_url = v;
  if (const char* v = getenv_nonempty("VIGIL_LOG_LEVEL")) c.log_level = v;
  if (const char* v = getenv_nonempty("VIGIL_REGISTRATION_KEY")) c.registration_key = v;
}

static void require_positive(int v, const char* field) {
  if (v <= 0) throw ConfigError(std::string(field) + " must be > 0 (got " + std::to_string(v) + ")");
}

void validate_config(const AgentConfig& c) {
  if (c.server_url.empty()) throw ConfigError("serverUrl is required");
  if (c.server_url.rfind("http://", 0) != 0 && c.server_url.rfind("https://", 0) != 0)
    throw ConfigError("serverUrl must start with http:// or https://");
  require_positive(c.heartbeat_interval, "heartbeatInterval");
  require_positive(c.data_upload_interval, "dataUploadInterval");
  require_positive(c.scan_interval, "scanInterval");
  require_positive(c.process_interval, "processInterval");
  require_positive(c.network_interval, "networkInterval");
  require_positive(c.persistence_interval, "persistenceInterval");
  require_positive(c.max_storage_size, "maxStorageSize");
  require_positive(c.upload_batch_size, "uploadBatchSize");
  require_positive(c.request_timeout_seconds, "requestTimeoutSeconds");
  require_positive(c.stop_grace_ms, "stopGraceMs");
  if (c.max_delivery_retries < 0) throw ConfigError("maxDeliveryRetries must be >= 0");
  if (c.enqueue_timeout_ms < 0) throw ConfigError("enqueueTimeoutMs must be >= 0");
  if (c.scan_depth < 0) throw ConfigError("scanDepth must be >= 0");
  if (c.queue_overflow_policy != "drop-oldest" && c.queue_overflow_policy != "block")
    throw ConfigError("queueOverflowPolicy must be drop-oldest or block");
  static const char* levels[] = {"debug", "info", "warn", "warning", "error"};
  bool level_ok = false;
  for (auto* l : levels) if (c.log_level == l) level_ok = true;
  if (!level_ok) throw ConfigError("logLevel must be one of debug|info|warn|error");
  if (c.registration_endpoint.empty() || c.data_endpoint.empty() || c.heartbeat_endpoint.empty())
    throw ConfigError("endpoints must not be empty");
}

auto load_config(const std::string& path) -> AgentConfig {
  AgentConfig c;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    spdlog::warn("Config: {} not found, writing defaults", path);
    save_config(c, path);
  } else {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file " + path);
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) throw ConfigError("config file " + path + " is not valid JSON");
    c = config_from_json(j);
  }
  apply_env_overrides(c);
  validate_config(c);
  return c;
}

void save_config(const AgentConfig& c, const std::string& path) {
  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  std::ofstream out(path, std::ios::trunc);
  if (!out) throw ConfigError("cannot write config file " + path);
  out << config_to_json(c).dump(2) << "\n";
  if (!out) throw ConfigError("short write to config file " + path);
}

auto endpoint_url(const AgentConfig& c, const std::string& endpoint) -> std::string {
  if (endpoint.rfind("http://", 0) == 0 || endpoint.rfind("https://", 0) == 0) return endpoint;
  std::string base = c.server_url;
  while (!base.empty() && base.back() == '/') base.pop_back();
  if (!endpoint.empty() && endpoint.front() != '/') base.push_back('/');
  return base + endpoint;
}

} // namespace vigil::app
