#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace vigil::model {

enum class EventType { Process, Network, Persistence, File, Malware, Vulnerability, Auth, System };
enum class Severity { Critical, High, Medium, Low, Info };

[[nodiscard]] const char* to_string(EventType t);
[[nodiscard]] const char* to_string(Severity s);

struct Event {
  EventType type{EventType::System};
  Severity severity{Severity::Info};
  std::chrono::system_clock::time_point timestamp{};
  std::string message;
  nlohmann::json details = nlohmann::json::object();
  std::string dedup_key;
  // Delivery attempts so far; owned by the queue.
  int attempts{0};
};

[[nodiscard]] auto make_event(EventType type, Severity sev, std::string message,
                              nlohmann::json details, std::string dedup_key) -> Event;

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.000Z
[[nodiscard]] auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

// Wire form used by the data upload.
[[nodiscard]] auto to_json(const Event& e) -> nlohmann::json;

} // namespace vigil::model
