#include "app/HostProbe.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <string_view>
#include <spdlog/spdlog.h>

namespace vigil::app {

static inline uint64_t parse_u64(const std::string_view& sv) {
  uint64_t v = 0;
  auto s = sv;
  // strip non-digits on right (e.g., kB)
  while (!s.empty() && (s.back() < '0' || s.back() > '9')) s.remove_suffix(1);
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  std::from_chars(s.data(), s.data() + s.size(), v);
  return v;
}

static std::string unquote(std::string s) {
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) s = s.substr(1, s.size() - 2);
  return s;
}

void LinuxHostProbe::parse_os_release(const std::string& text, std::string& name, std::string& version) {
  std::istringstream ss(text);
  std::string line, version_id;
  while (std::getline(ss, line)) {
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    auto key = line.substr(0, eq);
    auto val = unquote(vigil::util::trim_copy(line.substr(eq + 1)));
    if (key == "NAME") name = val;
    else if (key == "VERSION") version = val;
    else if (key == "VERSION_ID") version_id = val;
  }
  if (version.empty()) version = version_id;
}

static std::string primary_ipv4() {
  struct ifaddrs* ifs = nullptr;
  if (::getifaddrs(&ifs) != 0) return {};
  std::string ip;
  for (auto* it = ifs; it; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    if ((it->ifa_flags & IFF_LOOPBACK) || !(it->ifa_flags & IFF_UP)) continue;
    char buf[INET_ADDRSTRLEN]{};
    auto* sin = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
    if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) { ip = buf; break; }
  }
  ::freeifaddrs(ifs);
  return ip;
}

vigil::model::SystemInfo LinuxHostProbe::system_info() {
  vigil::model::SystemInfo info;
  char host[256]{};
  if (::gethostname(host, sizeof(host) - 1) == 0) info.hostname = host;
  info.ip = primary_ipv4();
  if (info.ip.empty()) {
    spdlog::warn("Host: no non-loopback IPv4 address found");
    info.ip = "127.0.0.1";
  }
  auto rel = vigil::util::read_file_string("/etc/os-release");
  if (!rel) rel = vigil::util::read_file_string("/usr/lib/os-release");
  if (rel) parse_os_release(*rel, info.os_name, info.os_version);
  struct utsname u{};
  if (::uname(&u) == 0) {
    info.kernel = std::string(u.sysname) + " " + u.release;
    if (info.os_name.empty()) info.os_name = u.sysname;
    if (info.os_version.empty()) info.os_version = u.release;
  }
  return info;
}

double LinuxHostProbe::cpu_usage() {
  auto txt = vigil::util::read_file_string("/proc/stat");
  if (!txt) return 0.0;
  std::istringstream ss(*txt);
  std::string label;
  uint64_t vals[8]{};
  ss >> label;
  for (auto& v : vals) ss >> v;
  uint64_t total = 0;
  for (auto v : vals) total += v;
  const uint64_t idle = vals[3] + vals[4]; // idle + iowait

  std::lock_guard<std::mutex> lk(mu_);
  // first call: average since boot
  uint64_t dt = total - last_total_;
  uint64_t di = idle - last_idle_;
  last_total_ = total; last_idle_ = idle;
  if (dt == 0) return 0.0;
  return 100.0 * static_cast<double>(dt - std::min(di, dt)) / static_cast<double>(dt);
}

vigil::model::SystemMetrics LinuxHostProbe::metrics() {
  vigil::model::SystemMetrics m;
  m.cpu_usage = cpu_usage();

  if (auto txt = vigil::util::read_file_string("/proc/meminfo")) {
    uint64_t total = 0, avail = 0;
    std::istringstream ss(*txt); std::string line;
    while (std::getline(ss, line)) {
      std::string_view sv(line);
      if (sv.starts_with("MemTotal:")) total = parse_u64(sv.substr(9));
      else if (sv.starts_with("MemAvailable:")) avail = parse_u64(sv.substr(13));
    }
    if (total > 0) m.memory_usage = 100.0 * static_cast<double>(total - std::min(avail, total)) / static_cast<double>(total);
  }

  struct statvfs vfs{};
  if (::statvfs(vigil::util::map_host_path("/").c_str(), &vfs) == 0) {
    uint64_t total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    uint64_t avail = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    if (total > 0) m.disk_usage = 100.0 * static_cast<double>(total - std::min(avail, total)) / static_cast<double>(total);
  }

  if (auto up = vigil::util::read_file_string("/proc/uptime")) {
    m.uptime_s = static_cast<uint64_t>(std::strtod(up->c_str(), nullptr));
  }

  for (auto& n : vigil::util::list_dir("/proc")) {
    if (!n.empty() && n[0] >= '0' && n[0] <= '9') ++m.process_count;
  }

  for (const char* t : {"/proc/net/tcp", "/proc/net/tcp6"}) {
    auto txt = vigil::util::read_file_string(t);
    if (!txt) continue;
    std::istringstream ss(*txt); std::string line; bool header = true;
    while (std::getline(ss, line)) {
      if (header) { header = false; continue; }
      if (!vigil::util::trim_copy(line).empty()) ++m.connection_count;
    }
  }
  return m;
}

} // namespace vigil::app
