#include "app/Differ.hpp"

namespace vigil::app {

using namespace vigil::model;

Delta<ProcessItem> diff_processes(const std::vector<ProcessItem>& prev, const std::vector<ProcessItem>& curr) {
  return diff_items(prev, curr,
    [](const ProcessItem& p){ return p.pid; },
    // cpu and rss move every poll; only identity-bearing fields count
    [](const ProcessItem& a, const ProcessItem& b){
      return a.start_time == b.start_time && a.name == b.name && a.exe_path == b.exe_path;
    });
}

Delta<ConnectionItem> diff_connections(const std::vector<ConnectionItem>& prev, const std::vector<ConnectionItem>& curr) {
  return diff_items(prev, curr,
    [](const ConnectionItem& c){ return c.key(); },
    [](const ConnectionItem& a, const ConnectionItem& b){ return a.state == b.state && a.pid == b.pid; });
}

Delta<PersistenceItem> diff_persistence(const std::vector<PersistenceItem>& prev, const std::vector<PersistenceItem>& curr) {
  return diff_items(prev, curr,
    [](const PersistenceItem& p){ return p.key_path; },
    [](const PersistenceItem& a, const PersistenceItem& b){ return a.content_hash == b.content_hash; });
}

Delta<FileArtifact> diff_files(const std::vector<FileArtifact>& prev, const std::vector<FileArtifact>& curr) {
  return diff_items(prev, curr,
    [](const FileArtifact& f){ return f.path; },
    [](const FileArtifact& a, const FileArtifact& b){
      return a.size == b.size && a.mtime == b.mtime && a.mode == b.mode;
    });
}

Delta<PackageItem> diff_packages(const std::vector<PackageItem>& prev, const std::vector<PackageItem>& curr) {
  return diff_items(prev, curr,
    [](const PackageItem& p){ return p.name; },
    [](const PackageItem& a, const PackageItem& b){ return a.version == b.version; });
}

} // namespace vigil::app
