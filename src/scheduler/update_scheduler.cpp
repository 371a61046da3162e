#include "panel_sync/update_scheduler.hpp"
#include "panel_sync/log.hpp"

namespace panel_sync {

UpdateScheduler::UpdateScheduler(IHostScheduler &host, ViewerRegistry &viewers,
                                 RepaintFn repaint,
                                 std::optional<Duration> interval)
    : host_(host), viewers_(viewers), repaint_(std::move(repaint)),
      interval_(interval) {}

UpdateScheduler::~UpdateScheduler() { stop(); }

void UpdateScheduler::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (task_.has_value())
    return;
  task_ = host_.run_timer(1, 1, [this] { tick(); });
  if (interval_.has_value())
    logger()->debug("update scheduler started, interval {}ms",
                    interval_->count());
  else
    logger()->debug("update scheduler started without interval");
}

void UpdateScheduler::stop() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!task_.has_value())
    return;
  host_.cancel(*task_);
  task_.reset();
  logger()->debug("update scheduler stopped");
}

bool UpdateScheduler::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return task_.has_value();
}

SchedulerStats UpdateScheduler::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

void UpdateScheduler::tick() {
  SchedulerStats delta;
  ++delta.ticks;
  for (const auto &state : viewers_.snapshot()) {
    const auto &viewer = *state->viewer();
    try {
      if (!viewer.online()) {
        if (viewers_.remove(state->id()) != nullptr) {
          state->cache().clear();
          ++delta.removed_offline;
        }
        continue;
      }
      if (should_repaint(*state)) {
        repaint_(*state);
        state->record_refresh();
        ++delta.repaints;
      }
    } catch (const std::exception &e) {
      ++delta.failures;
      logger()->warn("repaint failed for viewer {}: {}", viewer.name(),
                     e.what());
    } catch (...) {
      ++delta.failures;
      logger()->warn("repaint failed for viewer {}", viewer.name());
    }
  }
  std::lock_guard<std::mutex> lock(mu_);
  stats_.ticks += delta.ticks;
  stats_.repaints += delta.repaints;
  stats_.failures += delta.failures;
  stats_.removed_offline += delta.removed_offline;
}

bool UpdateScheduler::should_repaint(ViewerState &state) const {
  // Evaluate all three so the dirty flag is consumed on every tick.
  const bool dirty = state.consume_dirty();
  const bool interval_elapsed =
      interval_.has_value() && state.interval_elapsed(*interval_);
  const bool expired = state.has_expired_async_data();
  return dirty || interval_elapsed || expired;
}

} // namespace panel_sync
