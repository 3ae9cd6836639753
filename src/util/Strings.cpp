#include "util/Strings.hpp"

#include <algorithm>
#include <cctype>

namespace vigil::util {

auto to_lower_copy(std::string s) -> std::string {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

bool has_path_prefix(std::string_view path, std::string_view prefix) {
  if (prefix.empty()) return false;
  if (path.substr(0, prefix.size()) == prefix) return true;
  if (prefix.back() == '/') {
    auto trimmed = prefix.substr(0, prefix.size() - 1);
    if (path == trimmed) return true;
  }
  return false;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

auto trim_copy(std::string_view s) -> std::string {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

auto strip_deleted_suffix(const std::string& path) -> std::string {
  auto pos = path.find(" (deleted)");
  if (pos != std::string::npos) return path.substr(0, pos);
  return path;
}

auto extension_of(std::string_view path) -> std::string {
  auto base = basename_of(path);
  auto dot = base.rfind('.');
  if (dot == std::string::npos || dot == 0) return {};
  return to_lower_copy(base.substr(dot));
}

auto basename_of(std::string_view path) -> std::string {
  auto slash = path.rfind('/');
  if (slash == std::string_view::npos) return std::string(path);
  return std::string(path.substr(slash + 1));
}

auto split_ws(std::string_view s) -> std::vector<std::string> {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = i;
    while (j < s.size() && !std::isspace(static_cast<unsigned char>(s[j]))) ++j;
    if (j > i) out.emplace_back(s.substr(i, j - i));
    i = j;
  }
  return out;
}

} // namespace vigil::util
