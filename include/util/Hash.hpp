#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace vigil::util {

// 64-bit FNV-1a; stable across runs and hosts
[[nodiscard]] uint64_t fnv1a64(std::string_view data);

// 16 lowercase hex digits
[[nodiscard]] auto hash_hex(std::string_view data) -> std::string;

} // namespace vigil::util
