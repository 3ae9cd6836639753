#include "model/Event.hpp"
#include "model/Process.hpp"
#include "model/Snapshot.hpp"

#include <ctime>
#include <cstdio>

namespace vigil::model {

const char* to_string(SigningStatus s) {
  switch (s) {
    case SigningStatus::Signed: return "signed";
    case SigningStatus::Unsigned: return "unsigned";
    case SigningStatus::Invalid: return "invalid";
    case SigningStatus::Unknown: break;
  }
  return "unknown";
}

std::string ConnectionItem::key() const {
  std::string k;
  k.reserve(protocol.size() + local_ip.size() + remote_ip.size() + 16);
  k += protocol; k += '|';
  k += local_ip; k += ':'; k += std::to_string(local_port); k += '|';
  k += remote_ip; k += ':'; k += std::to_string(remote_port);
  return k;
}

const char* to_string(Category c) {
  switch (c) {
    case Category::Process: return "process";
    case Category::Network: return "network";
    case Category::Persistence: return "persistence";
    case Category::File: return "file";
    case Category::Package: return "package";
    case Category::Auth: return "auth";
  }
  return "unknown";
}

size_t SnapshotSet::size_of(Category c) const {
  switch (c) {
    case Category::Process: return processes.size();
    case Category::Network: return connections.size();
    case Category::Persistence: return persistence.size();
    case Category::File: return files.size();
    case Category::Package: return packages.size();
    case Category::Auth: return 0;
  }
  return 0;
}

void SnapshotSet::clear() {
  processes.clear(); connections.clear(); persistence.clear(); files.clear(); packages.clear();
}

const char* to_string(EventType t) {
  switch (t) {
    case EventType::Process: return "process";
    case EventType::Network: return "network";
    case EventType::Persistence: return "persistence";
    case EventType::File: return "file";
    case EventType::Malware: return "malware";
    case EventType::Vulnerability: return "vulnerability";
    case EventType::Auth: return "auth";
    case EventType::System: return "system";
  }
  return "system";
}

const char* to_string(Severity s) {
  switch (s) {
    case Severity::Critical: return "critical";
    case Severity::High: return "high";
    case Severity::Medium: return "medium";
    case Severity::Low: return "low";
    case Severity::Info: return "info";
  }
  return "info";
}

auto make_event(EventType type, Severity sev, std::string message,
                nlohmann::json details, std::string dedup_key) -> Event {
  Event e;
  e.type = type;
  e.severity = sev;
  e.timestamp = std::chrono::system_clock::now();
  e.message = std::move(message);
  e.details = std::move(details);
  e.dedup_key = std::move(dedup_key);
  return e;
}

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
  using namespace std::chrono;
  auto secs = time_point_cast<seconds>(tp);
  auto ms = duration_cast<milliseconds>(tp - secs).count();
  std::time_t t = system_clock::to_time_t(secs);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

auto to_json(const Event& e) -> nlohmann::json {
  return nlohmann::json{
    {"eventType", to_string(e.type)},
    {"severity", to_string(e.severity)},
    {"timestamp", format_timestamp(e.timestamp)},
    {"message", e.message},
    {"details", e.details},
    {"dedupKey", e.dedup_key},
  };
}

} // namespace vigil::model
