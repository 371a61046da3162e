#pragma once

#include "panel_sync/clock.hpp"
#include "panel_sync/host.hpp"
#include "panel_sync/open_result.hpp"
#include "panel_sync/viewer_state.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace panel_sync {

// Holds back a viewer's first paint until every awaited cache key is terminal
// or `max_wait` runs out. `on_done` fires once unless cancel() wins.
class InitialLoadGate : public std::enable_shared_from_this<InitialLoadGate> {
public:
  using PaintFn = std::function<void()>;
  using DiscardFn = std::function<void()>;
  using DoneFn = std::function<void(const OpenResult &)>;

  struct Callbacks {
    PaintFn paint;
    DiscardFn discard;
    DoneFn on_done;
  };

  static std::shared_ptr<InitialLoadGate>
  create(IHostScheduler &host, std::shared_ptr<ViewerState> state,
         std::vector<std::string> keys, Duration max_wait,
         Callbacks callbacks,
         std::shared_ptr<const IClock> clock = system_clock());

  void start();
  void poll();
  // Stops polling and drops a paint still queued for the render thread. No
  // outcome is reported.
  void cancel();

  bool finished() const { return finished_; }
  const std::vector<std::string> &keys() const { return keys_; }

private:
  InitialLoadGate(IHostScheduler &host, std::shared_ptr<ViewerState> state,
                  std::vector<std::string> keys, Duration max_wait,
                  Callbacks callbacks, std::shared_ptr<const IClock> clock);

  void stop_polling();
  void paint_and_complete(OpenResult result);
  void complete(const OpenResult &result);
  Duration elapsed() const;

  IHostScheduler &host_;
  std::shared_ptr<ViewerState> state_;
  std::vector<std::string> keys_;
  Duration max_wait_;
  Callbacks callbacks_;
  std::shared_ptr<const IClock> clock_;
  std::optional<TaskId> timer_;
  TimePoint started_at_{};
  bool started_{false};
  bool finished_{false};
  bool cancelled_{false};
};

} // namespace panel_sync
