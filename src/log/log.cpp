#include "panel_sync/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace panel_sync {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("panel_sync"))
      return existing;
    return spdlog::stderr_color_mt("panel_sync");
  }();
  return instance;
}

bool set_log_level(const std::string &level, std::string *err) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off; only accept "off" when asked for.
  if (parsed == spdlog::level::off && level != "off") {
    if (err)
      *err = "unknown log level: " + level;
    return false;
  }
  logger()->set_level(parsed);
  return true;
}

} // namespace panel_sync
