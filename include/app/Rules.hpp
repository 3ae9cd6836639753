#pragma once
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>
#include "app/Config.hpp"

namespace vigil::app {

struct VulnEntry {
  std::string package;
  std::string version;
  bool prefix{false};       // false: exact upstream version
  std::string cve;
  std::string title;
};

// Immutable detection data, built once at initialize() and shared read-only
// by every pipeline. All strings are lower case.
struct DetectionRules {
  std::vector<std::string> name_tokens;            // substring match
  std::unordered_set<std::string> tool_names;      // exact process name
  std::vector<std::string> suspicious_dirs;        // prefix match, trailing '/'
  std::unordered_set<std::string> dropper_extensions;
  std::unordered_set<std::string> script_extensions;
  std::unordered_set<std::string> binary_extensions;
  std::unordered_set<uint16_t> suspicious_ports;
  std::unordered_set<uint16_t> web_ports;
  std::unordered_set<std::string> interpreters;
  std::vector<std::string> content_patterns;
  std::vector<VulnEntry> vulnerabilities;

  uint64_t min_executable_size{20000};   // bytes
  double cpu_alert_threshold{90.0};      // percent of one core
  double vuln_confidence{0.9};
  double malware_confidence{0.7};
  bool scan_content{false};              // malwareScanning capability
};

[[nodiscard]] auto default_rules() -> DetectionRules;

// default_rules() with the configured directories, threshold and capabilities
[[nodiscard]] auto rules_from_config(const AgentConfig& cfg) -> DetectionRules;

} // namespace vigil::app
