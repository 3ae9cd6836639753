#include "util/Hash.hpp"

#include <cstdio>

namespace vigil::util {

uint64_t fnv1a64(std::string_view data) {
  uint64_t h = 14695981039346656037ULL;
  for (unsigned char c : data) {
    h ^= c;
    h *= 1099511628211ULL;
  }
  return h;
}

auto hash_hex(std::string_view data) -> std::string {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fnv1a64(data)));
  return std::string(buf, 16);
}

} // namespace vigil::util
