// Helpers for reading /proc and host files with optional root remap
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vigil::util {

// Map an absolute /proc path to an alternate root if VIGIL_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map any other absolute path (/etc, /var, /home, ...) to VIGIL_HOST_ROOT if set
auto map_host_path(const std::string& abs) -> std::string;

// Dispatches to map_proc_path or map_host_path
auto map_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read at most max_bytes from the start of a file.
auto read_file_head(const std::string& abs, size_t max_bytes) -> std::optional<std::string>;

// Read entire file as bytes. Returns std::nullopt on error.
auto read_file_bytes(const std::string& abs) -> std::optional<std::vector<unsigned char>>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// Target of a symlink such as /proc/<pid>/exe
auto read_symlink(const std::string& abs) -> std::optional<std::string>;

// Size in bytes of a regular file, nullopt if it cannot be stat'ed
auto file_size(const std::string& abs) -> std::optional<uint64_t>;

} // namespace vigil::util
