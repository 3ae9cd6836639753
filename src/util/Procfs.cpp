#include "util/Procfs.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace vigil::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string rebase(const std::string& root, const std::string& abs) {
  if (root.empty() || abs.empty() || abs.front() != '/') return abs;
  // Already remapped (callers sometimes pass a mapped path back in)
  if (abs.rfind(root, 0) == 0) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  return rebase(env_root("VIGIL_PROC_ROOT"), abs);
}

auto map_host_path(const std::string& abs) -> std::string {
  return rebase(env_root("VIGIL_HOST_ROOT"), abs);
}

auto map_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) == 0) return map_proc_path(abs);
  return map_host_path(abs);
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs), std::ios::binary);
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt; // vanished mid-read
  return s;
}

auto read_file_head(const std::string& abs, size_t max_bytes) -> std::optional<std::string> {
  std::ifstream in(map_path(abs), std::ios::binary);
  if (!in) return std::nullopt;
  std::string s(max_bytes, '\0');
  in.read(s.data(), static_cast<std::streamsize>(max_bytes));
  if (in.bad()) return std::nullopt;
  s.resize(static_cast<size_t>(in.gcount()));
  return s;
}

auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>> {
  std::ifstream in(map_path(abs), std::ios::binary);
  if (!in) return std::nullopt;
  std::vector<unsigned char> buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt;
  return buf;
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

auto read_symlink(const std::string& abs) -> std::optional<std::string> {
  auto path = map_path(abs);
  char buf[4096];
  ssize_t n = ::readlink(path.c_str(), buf, sizeof(buf) - 1);
  if (n <= 0) return std::nullopt;
  buf[n] = '\0';
  return std::string(buf, static_cast<size_t>(n));
}

auto file_size(const std::string& abs) -> std::optional<uint64_t> {
  struct stat st{};
  if (::stat(map_path(abs).c_str(), &st) != 0) return std::nullopt;
  if (!S_ISREG(st.st_mode)) return std::nullopt;
  return static_cast<uint64_t>(st.st_size);
}

} // namespace vigil::util
