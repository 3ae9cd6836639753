#pragma once
#include <string>
#include <vector>
#include "model/Fs.hpp"
#include "model/Net.hpp"
#include "model/Package.hpp"
#include "model/Persistence.hpp"
#include "model/Process.hpp"

namespace vigil::model {

enum class Category { Process, Network, Persistence, File, Package, Auth };

[[nodiscard]] const char* to_string(Category c);

// Output of one poll. A collector fills only the vectors of its own category.
struct SnapshotSet {
  std::vector<ProcessItem>     processes;
  std::vector<ConnectionItem>  connections;
  std::vector<PersistenceItem> persistence;
  std::vector<FileArtifact>    files;
  std::vector<PackageItem>     packages;

  [[nodiscard]] size_t size_of(Category c) const;
  void clear();
};

} // namespace vigil::model
