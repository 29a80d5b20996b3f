#include <crazycar/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace crazycar {

static constexpr const char* kLoggerName = "crazycar";

std::shared_ptr<spdlog::logger> log() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    if (auto existing = spdlog::get(kLoggerName)) return existing;
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::info);
    return created;
  }();
  return logger;
}

void init_logging(const LogConfig& cfg) {
  auto lg = log();
  auto level = spdlog::level::from_str(cfg.level);
  // from_str maps unknown names to off; only honor "off" when asked for it.
  if (level == spdlog::level::off && cfg.level != "off") level = spdlog::level::info;
  lg->set_level(level);
  if (!cfg.pattern.empty()) lg->set_pattern(cfg.pattern);
}

} // namespace crazycar
