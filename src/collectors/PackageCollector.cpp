#include "collectors/PackageCollector.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <sstream>
#include <spdlog/spdlog.h>

namespace vigil::collectors {

PackageCollector::PackageCollector(std::string status_path) : status_path_(std::move(status_path)) {}

bool PackageCollector::start() {
  if (!vigil::util::file_size(status_path_)) {
    set_error("package database " + status_path_ + " not found");
    return false;
  }
  return true;
}

void PackageCollector::parse_status(const std::string& text, std::vector<vigil::model::PackageItem>& out) {
  std::istringstream ss(text);
  std::string line, name, version, status;
  auto flush = [&]{
    if (!name.empty() && !version.empty() && status.find("installed") != std::string::npos &&
        status.find("not-installed") == std::string::npos && status.find("config-files") == std::string::npos) {
      out.push_back(vigil::model::PackageItem{name, version});
    }
    name.clear(); version.clear(); status.clear();
  };
  while (std::getline(ss, line)) {
    if (line.empty()) { flush(); continue; }
    if (line.rfind("Package:", 0) == 0) name = vigil::util::trim_copy(line.substr(8));
    else if (line.rfind("Version:", 0) == 0) version = vigil::util::trim_copy(line.substr(8));
    else if (line.rfind("Status:", 0) == 0) status = vigil::util::trim_copy(line.substr(7));
  }
  flush();
}

bool PackageCollector::poll(vigil::model::SnapshotSet& out, std::stop_token st) {
  clear_error();
  if (st.stop_requested()) { set_error("cancelled"); return false; }
  auto txt = vigil::util::read_file_string(status_path_);
  if (!txt) {
    set_error("cannot read " + status_path_);
    return false;
  }
  const size_t before = out.packages.size();
  parse_status(*txt, out.packages);
  spdlog::debug("Package: {} installed", out.packages.size() - before);
  return true;
}

} // namespace vigil::collectors
