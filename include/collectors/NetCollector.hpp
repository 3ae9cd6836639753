#pragma once
#include "collectors/ICollector.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

namespace vigil::collectors {

// Sockets from /proc/net/{tcp,tcp6,udp,udp6}, attributed to processes
// through the socket inodes under /proc/<pid>/fd.
class NetCollector : public ICollector {
public:
  bool poll(vigil::model::SnapshotSet& out, std::stop_token st) override;
  const char* name() const override { return "network"; }
  vigil::model::Category category() const override { return vigil::model::Category::Network; }

  // "0100007F:0035" -> ("127.0.0.1", 53); 32-digit addresses are IPv6
  static bool decode_endpoint(const std::string& hex, std::string& ip, uint16_t& port);
  static const char* state_name(unsigned code, bool udp);

private:
  struct Owner { int32_t pid; std::string name; };
  std::unordered_map<uint64_t, Owner> socket_owners(std::stop_token st) const;
};

} // namespace vigil::collectors
