#pragma once
#include <string>
#include <spdlog/common.h>

namespace vigil::util {

// debug|info|warn|error (also accepts "warning"); unknown -> info
[[nodiscard]] auto parse_log_level(const std::string& s) -> spdlog::level::level_enum;

// Installs the process-wide default logger: stderr always, plus a file sink
// at file_path when it can be opened. Returns false if the file sink failed.
bool init_logging(const std::string& level, const std::string& file_path);

} // namespace vigil::util
