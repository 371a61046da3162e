#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace panel_sync {

std::shared_ptr<spdlog::logger> logger();

// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
bool set_log_level(const std::string &level, std::string *err = nullptr);

} // namespace panel_sync
