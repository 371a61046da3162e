#pragma once

#include "panel_sync/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace panel_sync {

struct SessionConfig {
  // 0 disables the periodic refresh.
  std::uint64_t update_interval_ms{0};
  std::uint64_t open_timeout_ms{3000};
  std::uint64_t default_ttl_ms{30000};
  std::uint64_t tick_ms{50};
  std::size_t worker_threads{4};
  std::string executor{"pool"};
  std::string log_level{"info"};

  std::optional<Duration> update_interval() const {
    if (update_interval_ms == 0)
      return std::nullopt;
    return Duration(update_interval_ms);
  }
  Duration open_timeout() const { return Duration(open_timeout_ms); }
  Ttl default_ttl() const {
    if (default_ttl_ms == 0)
      return std::nullopt;
    return Duration(default_ttl_ms);
  }
};

// Reads a flat JSON object. Unknown fields are ignored, numbers are clamped.
// On failure `cfg` is left as it was.
bool load_config(const std::string &path, SessionConfig &cfg,
                 std::string *err = nullptr);

} // namespace panel_sync
