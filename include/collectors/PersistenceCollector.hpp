#pragma once
#include "collectors/ICollector.hpp"
#include <string>

namespace vigil::collectors {

// Autorun points: cron tables, systemd units, rc scripts, the dynamic
// loader preload list, login shell hooks and desktop autostart entries.
class PersistenceCollector : public ICollector {
public:
  // Content kept for rule matching is capped here; the hash covers all of it
  static constexpr size_t kMaxContent = 1 << 20;

  bool poll(vigil::model::SnapshotSet& out, std::stop_token st) override;
  const char* name() const override { return "persistence"; }
  vigil::model::Category category() const override { return vigil::model::Category::Persistence; }

private:
  void add_file(vigil::model::SnapshotSet& out, const std::string& path, const char* kind);
  void add_dir(vigil::model::SnapshotSet& out, const std::string& dir, const char* kind, const char* suffix = nullptr);
};

} // namespace vigil::collectors
