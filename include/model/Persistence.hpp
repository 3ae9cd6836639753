#pragma once
#include <string>

namespace vigil::model {

// An autorun point: cron table, systemd unit, rc script, preload list.
struct PersistenceItem {
  std::string key_path;
  std::string kind;          // cron|systemd|rc|preload|profile|autostart
  std::string content;       // capped at PersistenceCollector::kMaxContent
  std::string content_hash;  // hex FNV-1a of the full content
};

} // namespace vigil::model
