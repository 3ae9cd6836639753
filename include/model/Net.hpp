#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vigil::model {

struct ConnectionItem {
  std::string protocol;     // tcp|tcp6|udp|udp6
  std::string local_ip;
  uint16_t    local_port{};
  std::string remote_ip;
  uint16_t    remote_port{};
  std::string state;        // ESTABLISHED, LISTEN, ...
  int32_t     pid{-1};      // -1 when the socket owner is not visible
  std::string process_name;

  // Identity across polls: protocol + both endpoints
  [[nodiscard]] std::string key() const;
};

} // namespace vigil::model
