#include "util/Log.hpp"
#include "util/Strings.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace vigil::util {

auto parse_log_level(const std::string& s) -> spdlog::level::level_enum {
  auto l = to_lower_copy(s);
  if (l == "trace") return spdlog::level::trace;
  if (l == "debug") return spdlog::level::debug;
  if (l == "warn" || l == "warning") return spdlog::level::warn;
  if (l == "error") return spdlog::level::err;
  return spdlog::level::info;
}

bool init_logging(const std::string& level, const std::string& file_path) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  bool file_ok = true;
  if (!file_path.empty()) {
    std::error_code ec;
    auto parent = std::filesystem::path(file_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
    } catch (const spdlog::spdlog_ex& e) {
      file_ok = false;
      std::fprintf(stderr, "vigil: Log: cannot open %s: %s\n", file_path.c_str(), e.what());
    }
  }
  auto logger = std::make_shared<spdlog::logger>("vigil", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] %v");
  logger->set_level(parse_log_level(level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return file_ok;
}

} // namespace vigil::util
