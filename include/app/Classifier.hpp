#pragma once
#include <optional>
#include <string>
#include <vector>
#include "app/Rules.hpp"
#include "model/Event.hpp"
#include "model/Snapshot.hpp"

namespace vigil::app {

struct Verdict {
  bool suspicious{false};
  vigil::model::Severity severity{vigil::model::Severity::Info};
  vigil::model::EventType type{vigil::model::EventType::System};
  std::vector<std::string> reasons;
  std::optional<double> confidence;
  std::vector<std::string> cves;

  // The first matching rule decides severity; later matches only add reasons
  void add(vigil::model::Severity sev, std::string reason);
};

// Pure rule evaluation of one item. None of these perform I/O.
[[nodiscard]] auto classify_process(const vigil::model::ProcessItem& p, const DetectionRules& r) -> Verdict;
[[nodiscard]] auto classify_connection(const vigil::model::ConnectionItem& c, const DetectionRules& r) -> Verdict;

// baseline: first poll after start; a plain new entry is not reported then
[[nodiscard]] auto classify_persistence(const vigil::model::PersistenceItem& p, bool changed, bool baseline,
                                        const DetectionRules& r) -> Verdict;
[[nodiscard]] auto classify_file(const vigil::model::FileArtifact& f, const DetectionRules& r) -> Verdict;
[[nodiscard]] auto classify_package(const vigil::model::PackageItem& p, const DetectionRules& r) -> Verdict;

// "1:7.2p2-4ubuntu2" -> "7.2p2"
[[nodiscard]] auto upstream_version(const std::string& v) -> std::string;

// Prefix matches stop at a component boundary: "1.0.1" matches "1.0.1f" but not "1.0.10"
[[nodiscard]] bool version_matches(const VulnEntry& e, const std::string& version);

} // namespace vigil::app
