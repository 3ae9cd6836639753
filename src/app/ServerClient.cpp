#include "app/ServerClient.hpp"
#include "app/Errors.hpp"

#include <chrono>
#include <spdlog/spdlog.h>

namespace vigil::app {

using nlohmann::json;

ServerClient::ServerClient(std::shared_ptr<IHttpTransport> transport, AgentConfig cfg)
  : transport_(std::move(transport)), cfg_(std::move(cfg)) {}

json ServerClient::registration_payload(const AgentConfig& cfg, const vigil::model::SystemInfo& info) {
  json caps = json::array();
  const auto& c = cfg.capabilities;
  if (c.file_system_monitoring) caps.push_back("fileSystemMonitoring");
  if (c.process_monitoring) caps.push_back("processMonitoring");
  if (c.network_monitoring) caps.push_back("networkMonitoring");
  if (c.registry_monitoring) caps.push_back("registryMonitoring");
  if (c.security_logs_monitoring) caps.push_back("securityLogsMonitoring");
  if (c.malware_scanning) caps.push_back("malwareScanning");
  if (c.vulnerability_scanning) caps.push_back("vulnerabilityScanning");
  return json{
    {"hostname", info.hostname},
    {"ip", info.ip},
    {"os", info.os_name},
    {"version", info.os_version},
    {"kernel", info.kernel},
    {"capabilities", caps},
    {"registrationKey", cfg.registration_key},
  };
}

json ServerClient::heartbeat_payload(const std::string& agent_id, const std::string& status,
                                     const vigil::model::SystemMetrics& m) {
  return json{
    {"agentId", agent_id},
    {"status", status},
    {"timestamp", vigil::model::format_timestamp(std::chrono::system_clock::now())},
    {"metrics", {
      {"cpuUsage", m.cpu_usage},
      {"memoryUsage", m.memory_usage},
      {"diskUsage", m.disk_usage},
      {"uptime", m.uptime_s},
      {"processCount", m.process_count},
      {"networkConnections", m.connection_count},
    }},
  };
}

json ServerClient::events_payload(const std::string& agent_id, const std::vector<vigil::model::Event>& events) {
  json arr = json::array();
  for (const auto& e : events) arr.push_back(vigil::model::to_json(e));
  return json{{"agentId", agent_id}, {"events", std::move(arr)}};
}

std::vector<std::string> ServerClient::auth_headers() const {
  std::vector<std::string> h;
  if (!cfg_.token.empty()) h.push_back("Authorization: Bearer " + cfg_.token);
  if (!cfg_.agent_id.empty()) h.push_back("X-Agent-Id: " + cfg_.agent_id);
  return h;
}

RegistrationResult ServerClient::register_agent(const vigil::model::SystemInfo& info) {
  const auto url = endpoint_url(cfg_, cfg_.registration_endpoint);
  HttpResponse resp;
  try {
    resp = transport_->post_json(url, registration_payload(cfg_, info).dump(), {}, std::stop_token{});
  } catch (const TransportError& e) {
    throw RegistrationError(std::string("registration request failed: ") + e.what());
  }
  if (!resp.ok()) {
    throw RegistrationError("registration rejected with HTTP " + std::to_string(resp.status));
  }
  json j = json::parse(resp.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) throw RegistrationError("registration response is not a JSON object");

  RegistrationResult r;
  try {
    r.agent_id = j.value("agentId", std::string());
    r.token = j.value("token", std::string());
    if (auto it = j.find("config"); it != j.end() && it->is_object()) {
      if (it->contains("heartbeatInterval")) r.heartbeat_interval = it->at("heartbeatInterval").get<int>();
      if (auto ep = it->find("endpoints"); ep != it->end() && ep->is_object()) {
        if (ep->contains("data")) r.data_endpoint = ep->at("data").get<std::string>();
        if (ep->contains("heartbeat")) r.heartbeat_endpoint = ep->at("heartbeat").get<std::string>();
      }
    }
  } catch (const json::exception& e) {
    throw RegistrationError(std::string("malformed registration response: ") + e.what());
  }
  if (r.agent_id.empty()) throw RegistrationError("registration response has no agentId");

  cfg_.agent_id = r.agent_id;
  cfg_.token = r.token;
  if (r.data_endpoint) cfg_.data_endpoint = *r.data_endpoint;
  if (r.heartbeat_endpoint) cfg_.heartbeat_endpoint = *r.heartbeat_endpoint;
  spdlog::info("ServerClient: registered as {}", r.agent_id);
  return r;
}

bool ServerClient::send_heartbeat(const std::string& status, const vigil::model::SystemMetrics& m, std::stop_token st) {
  const auto url = endpoint_url(cfg_, cfg_.heartbeat_endpoint);
  try {
    auto resp = transport_->post_json(url, heartbeat_payload(cfg_.agent_id, status, m).dump(), auth_headers(), st);
    if (!resp.ok()) {
      spdlog::warn("ServerClient: heartbeat rejected with HTTP {}", resp.status);
      return false;
    }
  } catch (const TransportError& e) {
    spdlog::warn("ServerClient: heartbeat failed: {}", e.what());
    return false;
  }
  spdlog::debug("ServerClient: heartbeat sent ({})", status);
  return true;
}

bool ServerClient::send_events(const std::vector<vigil::model::Event>& events, std::stop_token st) {
  if (events.empty()) return true;
  const auto url = endpoint_url(cfg_, cfg_.data_endpoint);
  try {
    auto resp = transport_->post_json(url, events_payload(cfg_.agent_id, events).dump(), auth_headers(), st);
    if (!resp.ok()) {
      spdlog::warn("ServerClient: upload of {} event(s) rejected with HTTP {}", events.size(), resp.status);
      return false;
    }
  } catch (const TransportError& e) {
    spdlog::warn("ServerClient: upload of {} event(s) failed: {}", events.size(), e.what());
    return false;
  }
  spdlog::info("ServerClient: uploaded {} event(s)", events.size());
  return true;
}

} // namespace vigil::app
