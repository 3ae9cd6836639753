#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vigil::model {

struct FileArtifact {
  std::string path;
  uint64_t size{};
  int64_t  mtime{};        // seconds since epoch
  uint32_t mode{};         // st_mode permission bits
  bool     executable{false};
  std::vector<std::string> tags;  // extension:.sh, hidden, ...
  std::string head;        // first bytes of small scripts, for content heuristics
};

} // namespace vigil::model
