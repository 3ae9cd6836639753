#pragma once
#include "collectors/ICollector.hpp"
#include <string>

namespace vigil::collectors {

// Installed packages from the dpkg status database
class PackageCollector : public ICollector {
public:
  explicit PackageCollector(std::string status_path = "/var/lib/dpkg/status");
  bool start() override;
  bool poll(vigil::model::SnapshotSet& out, std::stop_token st) override;
  const char* name() const override { return "package"; }
  vigil::model::Category category() const override { return vigil::model::Category::Package; }

  // Parses dpkg status stanzas; only "install ok installed" entries are kept
  static void parse_status(const std::string& text, std::vector<vigil::model::PackageItem>& out);

private:
  std::string status_path_;
};

} // namespace vigil::collectors
