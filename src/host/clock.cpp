#include "panel_sync/clock.hpp"

namespace panel_sync {

std::shared_ptr<const IClock> system_clock() {
  static const auto clock = std::make_shared<const SystemClock>();
  return clock;
}

} // namespace panel_sync
