#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace crazycar {

struct LogConfig {
  std::string level = "info";   // trace|debug|info|warn|error|critical|off
  std::string pattern = "%Y-%m-%d %H:%M:%S.%e %^%l%$ [%n] %v";
};

// Project-wide logger named "crazycar" (stderr, colored). Created lazily.
std::shared_ptr<spdlog::logger> log();

// Applies level and pattern. Unknown level names fall back to info.
void init_logging(const LogConfig& cfg);

} // namespace crazycar
