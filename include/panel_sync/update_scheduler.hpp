#pragma once

#include "panel_sync/host.hpp"
#include "panel_sync/types.hpp"
#include "panel_sync/viewer_state.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace panel_sync {

struct SchedulerStats {
  std::uint64_t ticks{0};
  std::uint64_t repaints{0};
  std::uint64_t failures{0};
  std::uint64_t removed_offline{0};
};

// Repaints a viewer when it is dirty, its interval elapsed, or its cache holds
// an expired entry. Offline viewers are dropped as they are found.
class UpdateScheduler {
public:
  using RepaintFn = std::function<void(ViewerState &)>;

  UpdateScheduler(IHostScheduler &host, ViewerRegistry &viewers,
                  RepaintFn repaint, std::optional<Duration> interval);
  ~UpdateScheduler();

  UpdateScheduler(const UpdateScheduler &) = delete;
  UpdateScheduler &operator=(const UpdateScheduler &) = delete;

  void start();
  void stop();
  bool running() const;

  void tick();

  std::optional<Duration> interval() const { return interval_; }
  SchedulerStats stats() const;

private:
  bool should_repaint(ViewerState &state) const;

  IHostScheduler &host_;
  ViewerRegistry &viewers_;
  RepaintFn repaint_;
  std::optional<Duration> interval_;
  mutable std::mutex mu_;
  std::optional<TaskId> task_;
  SchedulerStats stats_;
};

} // namespace panel_sync
