#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace panel_sync {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

// Absent means the value never expires.
using Ttl = std::optional<Duration>;

using Value = std::any;
using Loader = std::function<Value()>;

enum class CacheState { Loading, Success, Error };

std::string to_string(CacheState state);

inline bool is_terminal(CacheState state) {
  return state != CacheState::Loading;
}

} // namespace panel_sync
