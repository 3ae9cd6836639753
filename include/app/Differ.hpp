#pragma once
#include <cstddef>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include "model/Snapshot.hpp"

namespace vigil::app {

template <typename T>
struct Delta {
  std::vector<T> added;
  std::vector<T> removed;
  std::vector<std::pair<T, T>> changed;  // (previous, current)
  size_t duplicates{0};                  // repeated keys in current; later one kept

  [[nodiscard]] bool empty() const { return added.empty() && removed.empty() && changed.empty(); }
};

// Generic keyed diff. key(item) yields a hashable identity, same(a, b)
// decides whether two items with one key carry equal content. O(n).
template <typename T, typename KeyFn, typename SameFn>
[[nodiscard]] Delta<T> diff_items(const std::vector<T>& prev, const std::vector<T>& curr, KeyFn key, SameFn same) {
  using K = std::decay_t<decltype(key(std::declval<const T&>()))>;
  Delta<T> d;

  std::unordered_map<K, size_t> prev_idx;
  prev_idx.reserve(prev.size());
  for (size_t i = 0; i < prev.size(); ++i) prev_idx[key(prev[i])] = i;

  std::unordered_map<K, size_t> curr_idx;
  curr_idx.reserve(curr.size());
  for (size_t i = 0; i < curr.size(); ++i) {
    auto [it, inserted] = curr_idx.try_emplace(key(curr[i]), i);
    if (!inserted) { it->second = i; ++d.duplicates; }
  }

  for (size_t i = 0; i < curr.size(); ++i) {
    const K k = key(curr[i]);
    auto ci = curr_idx.find(k);
    if (ci->second != i) continue; // shadowed by a later duplicate
    auto pi = prev_idx.find(k);
    if (pi == prev_idx.end()) {
      d.added.push_back(curr[i]);
    } else if (!same(prev[pi->second], curr[i])) {
      d.changed.emplace_back(prev[pi->second], curr[i]);
    }
  }
  for (size_t i = 0; i < prev.size(); ++i) {
    const K k = key(prev[i]);
    if (prev_idx[k] != i) continue;
    if (curr_idx.find(k) == curr_idx.end()) d.removed.push_back(prev[i]);
  }
  return d;
}

// Per-category identity and content rules
[[nodiscard]] Delta<vigil::model::ProcessItem> diff_processes(const std::vector<vigil::model::ProcessItem>& prev,
                                                              const std::vector<vigil::model::ProcessItem>& curr);
[[nodiscard]] Delta<vigil::model::ConnectionItem> diff_connections(const std::vector<vigil::model::ConnectionItem>& prev,
                                                                   const std::vector<vigil::model::ConnectionItem>& curr);
[[nodiscard]] Delta<vigil::model::PersistenceItem> diff_persistence(const std::vector<vigil::model::PersistenceItem>& prev,
                                                                    const std::vector<vigil::model::PersistenceItem>& curr);
[[nodiscard]] Delta<vigil::model::FileArtifact> diff_files(const std::vector<vigil::model::FileArtifact>& prev,
                                                           const std::vector<vigil::model::FileArtifact>& curr);
[[nodiscard]] Delta<vigil::model::PackageItem> diff_packages(const std::vector<vigil::model::PackageItem>& prev,
                                                             const std::vector<vigil::model::PackageItem>& curr);

} // namespace vigil::app
