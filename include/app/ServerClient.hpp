#pragma once
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include "app/Config.hpp"
#include "app/Transport.hpp"
#include "model/Event.hpp"
#include "model/Host.hpp"

namespace vigil::app {

struct RegistrationResult {
  std::string agent_id;
  std::string token;
  std::optional<int> heartbeat_interval;
  std::optional<std::string> data_endpoint;
  std::optional<std::string> heartbeat_endpoint;
};

// Wire protocol with the collection service. Holds its own copy of the
// config so scheduler threads never reach back into the agent.
class ServerClient {
public:
  ServerClient(std::shared_ptr<IHttpTransport> transport, AgentConfig cfg);

  // Throws RegistrationError on transport failure, non-2xx or a response
  // without an agentId
  [[nodiscard]] RegistrationResult register_agent(const vigil::model::SystemInfo& info);

  // false on any failure; the reason is logged
  bool send_heartbeat(const std::string& status, const vigil::model::SystemMetrics& m, std::stop_token st);
  bool send_events(const std::vector<vigil::model::Event>& events, std::stop_token st);

  [[nodiscard]] const AgentConfig& config() const { return cfg_; }

  // Payload builders, exposed for tests
  [[nodiscard]] static nlohmann::json registration_payload(const AgentConfig& cfg, const vigil::model::SystemInfo& info);
  [[nodiscard]] static nlohmann::json heartbeat_payload(const std::string& agent_id, const std::string& status,
                                                        const vigil::model::SystemMetrics& m);
  [[nodiscard]] static nlohmann::json events_payload(const std::string& agent_id,
                                                     const std::vector<vigil::model::Event>& events);

private:
  std::vector<std::string> auth_headers() const;

  std::shared_ptr<IHttpTransport> transport_;
  AgentConfig cfg_;
};

} // namespace vigil::app
