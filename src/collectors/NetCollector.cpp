#include "collectors/NetCollector.hpp"
#include "util/Procfs.hpp"
#include "util/Strings.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstring>
#include <sstream>
#include <spdlog/spdlog.h>

namespace vigil::collectors {

using vigil::model::ConnectionItem;

bool NetCollector::decode_endpoint(const std::string& hex, std::string& ip, uint16_t& port) {
  auto colon = hex.find(':');
  if (colon == std::string::npos) return false;
  std::string addr = hex.substr(0, colon);
  port = static_cast<uint16_t>(std::strtoul(hex.c_str() + colon + 1, nullptr, 16));
  char buf[INET6_ADDRSTRLEN]{};
  if (addr.size() == 8) {
    // kernel prints the in-memory (network order) word as host-order hex
    in_addr a{};
    a.s_addr = static_cast<uint32_t>(std::strtoul(addr.c_str(), nullptr, 16));
    if (!::inet_ntop(AF_INET, &a, buf, sizeof(buf))) return false;
  } else if (addr.size() == 32) {
    in6_addr a{};
    for (int w = 0; w < 4; ++w) {
      uint32_t word = static_cast<uint32_t>(std::strtoul(addr.substr(static_cast<size_t>(w) * 8, 8).c_str(), nullptr, 16));
      std::memcpy(&a.s6_addr[w * 4], &word, 4);
    }
    if (!::inet_ntop(AF_INET6, &a, buf, sizeof(buf))) return false;
  } else {
    return false;
  }
  ip = buf;
  return true;
}

const char* NetCollector::state_name(unsigned code, bool udp) {
  if (udp) return code == 0x01 ? "ESTABLISHED" : "UNCONN";
  switch (code) {
    case 0x01: return "ESTABLISHED";
    case 0x02: return "SYN_SENT";
    case 0x03: return "SYN_RECV";
    case 0x04: return "FIN_WAIT1";
    case 0x05: return "FIN_WAIT2";
    case 0x06: return "TIME_WAIT";
    case 0x07: return "CLOSE";
    case 0x08: return "CLOSE_WAIT";
    case 0x09: return "LAST_ACK";
    case 0x0A: return "LISTEN";
    case 0x0B: return "CLOSING";
    default: return "UNKNOWN";
  }
}

std::unordered_map<uint64_t, NetCollector::Owner> NetCollector::socket_owners(std::stop_token st) const {
  std::unordered_map<uint64_t, Owner> owners;
  for (auto& entry : vigil::util::list_dir("/proc")) {
    if (st.stop_requested()) break;
    if (entry.empty() || entry[0]<'0' || entry[0]>'9') continue;
    int32_t pid = static_cast<int32_t>(std::strtol(entry.c_str(), nullptr, 10));
    std::string fd_dir = "/proc/" + entry + "/fd";
    std::string comm;
    for (auto& fd : vigil::util::list_dir(fd_dir)) {
      auto link = vigil::util::read_symlink(fd_dir + "/" + fd);
      if (!link || link->rfind("socket:[", 0) != 0) continue;
      uint64_t inode = std::strtoull(link->c_str() + 8, nullptr, 10);
      if (comm.empty()) {
        auto c = vigil::util::read_file_string("/proc/" + entry + "/comm");
        comm = c ? vigil::util::trim_copy(*c) : std::string("?");
      }
      owners.emplace(inode, Owner{pid, comm});
    }
  }
  return owners;
}

bool NetCollector::poll(vigil::model::SnapshotSet& out, std::stop_token st) {
  clear_error();
  static const char* tables[] = {"tcp", "tcp6", "udp", "udp6"};
  auto owners = socket_owners(st);
  int readable = 0;
  for (const char* proto : tables) {
    if (st.stop_requested()) { set_error("cancelled"); return false; }
    auto txt = vigil::util::read_file_string(std::string("/proc/net/") + proto);
    if (!txt) continue; // tcp6/udp6 absent when IPv6 is disabled
    ++readable;
    const bool udp = proto[0] == 'u';
    std::istringstream ss(*txt);
    std::string line; bool header = true;
    while (std::getline(ss, line)) {
      if (header) { header = false; continue; }
      auto f = vigil::util::split_ws(line);
      if (f.size() < 10) continue;
      ConnectionItem c;
      c.protocol = proto;
      if (!decode_endpoint(f[1], c.local_ip, c.local_port)) continue;
      if (!decode_endpoint(f[2], c.remote_ip, c.remote_port)) continue;
      c.state = state_name(static_cast<unsigned>(std::strtoul(f[3].c_str(), nullptr, 16)), udp);
      uint64_t inode = std::strtoull(f[9].c_str(), nullptr, 10);
      if (auto it = owners.find(inode); it != owners.end()) {
        c.pid = it->second.pid;
        c.process_name = it->second.name;
      }
      out.connections.push_back(std::move(c));
    }
  }
  if (readable == 0) {
    set_error("no readable socket tables under " + vigil::util::map_proc_path("/proc/net"));
    return false;
  }
  spdlog::debug("Network: {} sockets, {} attributed", out.connections.size(), owners.size());
  return true;
}

} // namespace vigil::collectors
