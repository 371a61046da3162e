#include "panel_sync/viewer_state.hpp"

#include <stdexcept>

namespace panel_sync {

ViewerState::ViewerState(std::shared_ptr<IViewer> viewer,
                         std::shared_ptr<IExecutor> executor,
                         std::shared_ptr<const IClock> clock)
    : viewer_(std::move(viewer)), clock_(std::move(clock)),
      dirty_(std::make_shared<DirtyFlag>()) {
  if (!viewer_)
    throw std::invalid_argument("ViewerState requires a viewer");
  if (!clock_)
    clock_ = system_clock();
  id_ = viewer_->id();
  cache_ = AsyncCache::create(std::move(executor), clock_,
                              [flag = dirty_] { flag->mark(); });
}

bool ViewerState::interval_elapsed(Duration interval) const {
  if (!last_refresh_.has_value())
    return true;
  return clock_->now() > *last_refresh_ + interval;
}

void ViewerState::record_refresh() { last_refresh_ = clock_->now(); }

void ViewerState::set_value(const std::string &key, Value value) {
  {
    std::lock_guard<std::mutex> lock(values_mu_);
    values_.insert_or_assign(key, std::move(value));
  }
  invalidate();
}

std::optional<Value> ViewerState::value(const std::string &key) const {
  std::lock_guard<std::mutex> lock(values_mu_);
  auto it = values_.find(key);
  if (it == values_.end())
    return std::nullopt;
  return it->second;
}

bool ViewerState::has_value(const std::string &key) const {
  std::lock_guard<std::mutex> lock(values_mu_);
  return values_.contains(key);
}

void ViewerState::remove_value(const std::string &key) {
  std::lock_guard<std::mutex> lock(values_mu_);
  values_.erase(key);
}

bool ViewerRegistry::add(std::shared_ptr<ViewerState> state) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto id = state->id();
  return states_.emplace(id, std::move(state)).second;
}

std::shared_ptr<ViewerState> ViewerRegistry::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = states_.find(id);
  return it == states_.end() ? nullptr : it->second;
}

std::shared_ptr<ViewerState> ViewerRegistry::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = states_.find(id);
  if (it == states_.end())
    return nullptr;
  auto state = std::move(it->second);
  states_.erase(it);
  return state;
}

std::vector<std::shared_ptr<ViewerState>> ViewerRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::shared_ptr<ViewerState>> out;
  out.reserve(states_.size());
  for (const auto &[id, state] : states_)
    out.push_back(state);
  return out;
}

std::size_t ViewerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return states_.size();
}

} // namespace panel_sync
