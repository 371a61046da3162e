#pragma once

#include "panel_sync/async_cache.hpp"
#include "panel_sync/clock.hpp"
#include "panel_sync/computed.hpp"
#include "panel_sync/executor.hpp"
#include "panel_sync/types.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace panel_sync {

class IViewer {
public:
  virtual ~IViewer() = default;
  virtual std::string id() const = 0;
  virtual std::string name() const = 0;
  virtual bool online() const = 0;
};

class DirtyFlag {
public:
  void mark() noexcept { dirty_.store(true, std::memory_order_release); }
  bool consume() noexcept {
    return dirty_.exchange(false, std::memory_order_acq_rel);
  }
  bool peek() const noexcept { return dirty_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> dirty_{false};
};

// Refresh bookkeeping is render-thread only.
class ViewerState {
public:
  ViewerState(std::shared_ptr<IViewer> viewer,
              std::shared_ptr<IExecutor> executor,
              std::shared_ptr<const IClock> clock = system_clock());

  const std::shared_ptr<IViewer> &viewer() const { return viewer_; }
  const std::string &id() const { return id_; }
  AsyncCache &cache() { return *cache_; }
  const AsyncCache &cache() const { return *cache_; }

  void invalidate() { dirty_->mark(); }
  bool consume_dirty() { return dirty_->consume(); }
  bool dirty() const { return dirty_->peek(); }

  bool interval_elapsed(Duration interval) const;
  void record_refresh();
  std::optional<TimePoint> last_refresh() const { return last_refresh_; }
  bool has_expired_async_data() const { return cache_->has_expired_entries(); }
  template <typename T> Computed<T> computed(const std::string &key) const {
    return cache_->computed<T>(key);
  }

  void set_value(const std::string &key, Value value);
  std::optional<Value> value(const std::string &key) const;
  template <typename T>
  T value_or(const std::string &key, T fallback) const {
    auto v = value(key);
    if (!v.has_value())
      return fallback;
    if (const T *typed = std::any_cast<T>(&*v))
      return *typed;
    return fallback;
  }
  bool has_value(const std::string &key) const;
  void remove_value(const std::string &key);

private:
  std::shared_ptr<IViewer> viewer_;
  std::string id_;
  std::shared_ptr<const IClock> clock_;
  // Shared with the cache's dirty sink, which may fire after this state is
  // gone when a load completes late.
  std::shared_ptr<DirtyFlag> dirty_;
  std::shared_ptr<AsyncCache> cache_;
  std::optional<TimePoint> last_refresh_;
  mutable std::mutex values_mu_;
  std::map<std::string, Value> values_;
};

class ViewerRegistry {
public:
  bool add(std::shared_ptr<ViewerState> state);
  std::shared_ptr<ViewerState> find(const std::string &id) const;
  std::shared_ptr<ViewerState> remove(const std::string &id);
  std::vector<std::shared_ptr<ViewerState>> snapshot() const;
  std::size_t size() const;
  bool empty() const { return size() == 0; }

private:
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<ViewerState>> states_;
};

} // namespace panel_sync
