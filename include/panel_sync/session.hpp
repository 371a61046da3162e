#pragma once

#include "panel_sync/clock.hpp"
#include "panel_sync/executor.hpp"
#include "panel_sync/host.hpp"
#include "panel_sync/initial_load_gate.hpp"
#include "panel_sync/open_result.hpp"
#include "panel_sync/reactive_loader.hpp"
#include "panel_sync/update_scheduler.hpp"
#include "panel_sync/viewer_state.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace panel_sync {

class IPanelRenderer {
public:
  virtual ~IPanelRenderer() = default;
  virtual void render(ViewerState &state) = 0;
  virtual void present(ViewerState &state) = 0;
};

struct SessionOptions {
  std::optional<Duration> update_interval;
  std::shared_ptr<const IClock> clock{system_clock()};
};

// One panel and its open viewers. The update scheduler runs while at least
// one viewer has the panel open.
class PanelSession {
public:
  PanelSession(IHostScheduler &host, IPanelRenderer &renderer,
               std::shared_ptr<IExecutor> executor, SessionOptions options = {});
  ~PanelSession();

  PanelSession(const PanelSession &) = delete;
  PanelSession &operator=(const PanelSession &) = delete;

  ReactiveLoader &sources() { return sources_; }

  OpenResult open(std::shared_ptr<IViewer> viewer);
  // Holds the first paint until reactive data is ready or `max_wait` passes.
  // Replaces any wait still pending for the same viewer.
  void open(std::shared_ptr<IViewer> viewer, Duration max_wait,
            InitialLoadGate::DoneFn on_done);

  bool refresh(const std::string &viewer_id);
  void close(const std::string &viewer_id);

  std::shared_ptr<ViewerState> state(const std::string &viewer_id) const;
  std::size_t viewer_count() const { return viewers_.size(); }
  const UpdateScheduler *scheduler() const { return scheduler_.get(); }

private:
  std::shared_ptr<ViewerState> state_for(const std::shared_ptr<IViewer> &viewer);
  void cancel_gate(const std::string &viewer_id);
  void render(ViewerState &state);
  void start_scheduler();

  IHostScheduler &host_;
  IPanelRenderer &renderer_;
  std::shared_ptr<IExecutor> executor_;
  std::shared_ptr<const IClock> clock_;
  ViewerRegistry viewers_;
  ReactiveLoader sources_;
  std::unique_ptr<UpdateScheduler> scheduler_;
  std::map<std::string, std::weak_ptr<InitialLoadGate>> gates_;
};

} // namespace panel_sync
