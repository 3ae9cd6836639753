#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace vigil::util {

[[nodiscard]] auto to_lower_copy(std::string s) -> std::string;

// Case-sensitive; callers lower both sides first when needed.
// A prefix "/tmp/" also matches the bare directory "/tmp".
[[nodiscard]] bool has_path_prefix(std::string_view path, std::string_view prefix);

[[nodiscard]] bool ends_with(std::string_view s, std::string_view suffix);

[[nodiscard]] auto trim_copy(std::string_view s) -> std::string;

// Strips the " (deleted)" marker the kernel appends to unlinked exe links
[[nodiscard]] auto strip_deleted_suffix(const std::string& path) -> std::string;

// Lower-cased extension including the dot, empty if none
[[nodiscard]] auto extension_of(std::string_view path) -> std::string;

[[nodiscard]] auto basename_of(std::string_view path) -> std::string;

[[nodiscard]] auto split_ws(std::string_view s) -> std::vector<std::string>;

} // namespace vigil::util
