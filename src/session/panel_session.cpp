#include "panel_sync/session.hpp"
#include "panel_sync/log.hpp"

#include <stdexcept>

namespace panel_sync {

PanelSession::PanelSession(IHostScheduler &host, IPanelRenderer &renderer,
                           std::shared_ptr<IExecutor> executor,
                           SessionOptions options)
    : host_(host), renderer_(renderer), executor_(std::move(executor)),
      clock_(options.clock ? options.clock : system_clock()) {
  if (!executor_)
    throw std::invalid_argument("PanelSession requires an executor");
  if (options.update_interval.has_value()) {
    scheduler_ = std::make_unique<UpdateScheduler>(
        host_, viewers_, [this](ViewerState &state) { render(state); },
        options.update_interval);
  }
}

PanelSession::~PanelSession() {
  for (auto &[id, weak] : gates_) {
    if (auto gate = weak.lock())
      gate->cancel();
  }
  if (scheduler_)
    scheduler_->stop();
}

OpenResult PanelSession::open(std::shared_ptr<IViewer> viewer) {
  auto state = state_for(viewer);
  render(*state);
  renderer_.present(*state);
  state->record_refresh();
  start_scheduler();
  return OpenResult::immediate();
}

void PanelSession::open(std::shared_ptr<IViewer> viewer, Duration max_wait,
                        InitialLoadGate::DoneFn on_done) {
  if (sources_.empty()) {
    auto result = open(std::move(viewer));
    if (on_done)
      on_done(result);
    return;
  }

  auto state = state_for(viewer);
  const auto id = state->id();
  cancel_gate(id);
  // First render kicks off the loads the gate then waits on.
  render(*state);

  InitialLoadGate::Callbacks callbacks;
  callbacks.paint = [this, id] {
    auto current = viewers_.find(id);
    if (!current)
      return;
    render(*current);
    renderer_.present(*current);
    current->record_refresh();
    start_scheduler();
  };
  callbacks.discard = [this, id] {
    if (auto dropped = viewers_.remove(id))
      dropped->cache().clear();
  };
  callbacks.on_done = [this, id, on_done](const OpenResult &result) {
    gates_.erase(id);
    if (on_done)
      on_done(result);
  };

  auto gate = InitialLoadGate::create(host_, state, sources_.keys(), max_wait,
                                      std::move(callbacks), clock_);
  gates_[id] = gate;
  gate->start();
}

bool PanelSession::refresh(const std::string &viewer_id) {
  auto state = viewers_.find(viewer_id);
  if (!state)
    return false;
  render(*state);
  state->record_refresh();
  return true;
}

void PanelSession::close(const std::string &viewer_id) {
  cancel_gate(viewer_id);
  if (auto state = viewers_.remove(viewer_id))
    state->cache().clear();
  if (viewers_.empty() && scheduler_)
    scheduler_->stop();
}

std::shared_ptr<ViewerState>
PanelSession::state(const std::string &viewer_id) const {
  return viewers_.find(viewer_id);
}

std::shared_ptr<ViewerState>
PanelSession::state_for(const std::shared_ptr<IViewer> &viewer) {
  if (!viewer)
    throw std::invalid_argument("cannot open a panel for a null viewer");
  if (auto existing = viewers_.find(viewer->id()))
    return existing;
  auto state = std::make_shared<ViewerState>(viewer, executor_, clock_);
  viewers_.add(state);
  logger()->debug("viewer {} joined, {} active", viewer->name(),
                  viewers_.size());
  return state;
}

void PanelSession::cancel_gate(const std::string &viewer_id) {
  auto it = gates_.find(viewer_id);
  if (it == gates_.end())
    return;
  if (auto gate = it->second.lock())
    gate->cancel();
  gates_.erase(it);
}

void PanelSession::render(ViewerState &state) {
  sources_.trigger(state);
  renderer_.render(state);
}

void PanelSession::start_scheduler() {
  if (scheduler_ && !scheduler_->running())
    scheduler_->start();
}

} // namespace panel_sync
