#include "collectors/PersistenceCollector.hpp"
#include "util/Hash.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace vigil::collectors {

void PersistenceCollector::add_file(vigil::model::SnapshotSet& out, const std::string& path, const char* kind) {
  if (!vigil::util::file_size(path)) return; // absent or not a regular file
  auto txt = vigil::util::read_file_string(path);
  if (!txt) {
    spdlog::debug("Persistence: cannot read {}", path);
    return;
  }
  vigil::model::PersistenceItem item;
  item.key_path = path;
  item.kind = kind;
  item.content_hash = vigil::util::hash_hex(*txt);
  item.content = txt->size() > kMaxContent ? txt->substr(0, kMaxContent) : *txt;
  out.persistence.push_back(std::move(item));
}

void PersistenceCollector::add_dir(vigil::model::SnapshotSet& out, const std::string& dir, const char* kind, const char* suffix) {
  auto names = vigil::util::list_dir(dir);
  std::sort(names.begin(), names.end());
  for (auto& n : names) {
    if (suffix && !vigil::util::ends_with(n, suffix)) continue;
    std::string path = dir + "/" + n;
    // Enabled units are symlinks in *.wants; record the link target
    if (auto target = vigil::util::read_symlink(path)) {
      vigil::model::PersistenceItem item;
      item.key_path = path;
      item.kind = kind;
      item.content = "-> " + *target;
      item.content_hash = vigil::util::hash_hex(item.content);
      out.persistence.push_back(std::move(item));
      continue;
    }
    add_file(out, path, kind);
  }
}

bool PersistenceCollector::poll(vigil::model::SnapshotSet& out, std::stop_token st) {
  clear_error();
  const size_t before = out.persistence.size();

  add_file(out, "/etc/crontab", "cron");
  add_dir(out, "/etc/cron.d", "cron");
  add_dir(out, "/var/spool/cron/crontabs", "cron");
  if (st.stop_requested()) { set_error("cancelled"); return false; }

  add_dir(out, "/etc/systemd/system", "systemd", ".service");
  add_dir(out, "/etc/systemd/system", "systemd", ".timer");
  for (auto& n : vigil::util::list_dir("/etc/systemd/system")) {
    if (vigil::util::ends_with(n, ".wants")) add_dir(out, "/etc/systemd/system/" + n, "systemd");
  }
  if (st.stop_requested()) { set_error("cancelled"); return false; }

  add_file(out, "/etc/rc.local", "rc");
  add_dir(out, "/etc/init.d", "rc");
  add_file(out, "/etc/ld.so.preload", "preload");
  add_dir(out, "/etc/profile.d", "profile");
  add_file(out, "/etc/profile", "profile");
  add_file(out, "/etc/bash.bashrc", "profile");
  add_dir(out, "/etc/xdg/autostart", "autostart", ".desktop");
  if (st.stop_requested()) { set_error("cancelled"); return false; }

  std::vector<std::string> homes{"/root"};
  for (auto& u : vigil::util::list_dir("/home")) homes.push_back("/home/" + u);
  for (auto& h : homes) {
    add_file(out, h + "/.bashrc", "profile");
    add_file(out, h + "/.profile", "profile");
    add_file(out, h + "/.bash_profile", "profile");
    add_dir(out, h + "/.config/autostart", "autostart", ".desktop");
    add_dir(out, h + "/.config/systemd/user", "systemd", ".service");
  }

  spdlog::debug("Persistence: {} autorun points", out.persistence.size() - before);
  return true;
}

} // namespace vigil::collectors
