#include "collectors/FsCollector.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <sys/stat.h>
#include <filesystem>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace vigil::collectors {

static const std::unordered_set<std::string>& script_exts() {
  static const std::unordered_set<std::string> exts = {
    ".sh", ".py", ".rb", ".pl", ".php", ".ps1", ".bat", ".vbs", ".js"
  };
  return exts;
}

FsCollector::FsCollector(std::vector<std::string> roots, int max_depth, size_t max_files)
  : roots_(std::move(roots)), max_depth_(max_depth), max_files_(max_files) {}

bool FsCollector::poll(vigil::model::SnapshotSet& out, std::stop_token st) {
  clear_error();
  size_t count = 0;
  int walked = 0;
  for (const auto& root : roots_) {
    const std::string mapped = vigil::util::map_host_path(root);
    std::error_code ec;
    if (!fs::is_directory(mapped, ec)) {
      spdlog::debug("Filesystem: skipping {} (not a directory)", root);
      continue;
    }
    ++walked;
    fs::recursive_directory_iterator it(mapped, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      spdlog::debug("Filesystem: cannot open {}: {}", root, ec.message());
      continue;
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) { spdlog::debug("Filesystem: walk error under {}: {}", root, ec.message()); break; }
      if (st.stop_requested()) { set_error("cancelled"); return false; }
      if (it.depth() >= max_depth_ && it->is_directory(ec)) it.disable_recursion_pending();
      if (!it->is_regular_file(ec) || it->is_symlink(ec)) continue;

      struct stat sb{};
      const std::string real = it->path().string();
      if (::lstat(real.c_str(), &sb) != 0) continue;

      vigil::model::FileArtifact f;
      f.path = root + real.substr(mapped.size());
      f.size = static_cast<uint64_t>(sb.st_size);
      f.mtime = static_cast<int64_t>(sb.st_mtime);
      f.mode = static_cast<uint32_t>(sb.st_mode & 07777);
      f.executable = (sb.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
      auto ext = vigil::util::extension_of(f.path);
      if (!ext.empty()) f.tags.push_back("ext:" + ext);
      if (f.executable) f.tags.push_back("executable");
      auto base = vigil::util::basename_of(f.path);
      if (!base.empty() && base.front() == '.') f.tags.push_back("hidden");
      if (f.mode & S_ISUID) f.tags.push_back("setuid");
      const bool scriptish = f.executable || script_exts().count(ext) != 0;
      if (scriptish && f.size > 0 && f.size <= kHeadMaxSize) {
        if (auto head = vigil::util::read_file_head(real, kHeadBytes)) f.head = std::move(*head);
      }
      out.files.push_back(std::move(f));
      if (++count >= max_files_) {
        spdlog::warn("Filesystem: file cap {} reached, truncating scan", max_files_);
        return true;
      }
    }
  }
  if (walked == 0 && !roots_.empty()) {
    set_error("none of the scan directories exist");
    return false;
  }
  return true;
}

} // namespace vigil::collectors
