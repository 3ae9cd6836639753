#pragma once
#include "collectors/ICollector.hpp"
#include <string>
#include <vector>

namespace vigil::collectors {

// Depth-limited walk of the configured scan directories
class FsCollector : public ICollector {
public:
  FsCollector(std::vector<std::string> roots, int max_depth, size_t max_files = 20000);
  bool poll(vigil::model::SnapshotSet& out, std::stop_token st) override;
  const char* name() const override { return "filesystem"; }
  vigil::model::Category category() const override { return vigil::model::Category::File; }

  // Files at most this large get their first kHeadBytes captured when they look like scripts
  static constexpr uint64_t kHeadMaxSize = 64 * 1024;
  static constexpr size_t kHeadBytes = 4096;

private:
  std::vector<std::string> roots_;
  int max_depth_{3};
  size_t max_files_{20000};
};

} // namespace vigil::collectors
