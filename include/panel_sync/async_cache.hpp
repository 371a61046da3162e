#pragma once

#include "panel_sync/clock.hpp"
#include "panel_sync/computed.hpp"
#include "panel_sync/executor.hpp"
#include "panel_sync/types.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>

namespace panel_sync {

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t joins{0};
  std::uint64_t loads{0};
  std::uint64_t revalidations{0};
  std::uint64_t errors{0};
};

// Always owned through std::shared_ptr (see create()); in-flight loads keep
// only a weak reference, so dropping the cache mid-load discards the result.
class AsyncCache : public std::enable_shared_from_this<AsyncCache> {
public:
  using DirtySink = std::function<void()>;

  static std::shared_ptr<AsyncCache>
  create(std::shared_ptr<IExecutor> executor,
         std::shared_ptr<const IClock> clock = system_clock(),
         DirtySink on_change = {});

  std::optional<Value> get(const std::string &key) const;

  template <typename T> std::optional<T> get(const std::string &key) const {
    auto v = get(key);
    if (!v.has_value())
      return std::nullopt;
    if (const T *typed = std::any_cast<T>(&*v))
      return *typed;
    return std::nullopt;
  }

  template <typename T> Computed<T> computed(const std::string &key) const {
    const auto snap = snapshot(key);
    if (!snap.state.has_value())
      return Computed<T>::empty();
    switch (*snap.state) {
    case CacheState::Loading:
      return Computed<T>::loading();
    case CacheState::Error:
      return Computed<T>::error(snap.error);
    case CacheState::Success:
      break;
    }
    if constexpr (std::is_same_v<T, Value>) {
      return Computed<T>::success(snap.value);
    } else {
      if (const T *typed = std::any_cast<T>(&snap.value))
        return Computed<T>::success(*typed);
      return Computed<T>::error(std::make_exception_ptr(std::bad_any_cast()));
    }
  }

  // Stale entries still report Success; only is_expired() tells them apart.
  std::optional<CacheState> state(const std::string &key) const;
  std::optional<std::exception_ptr> error(const std::string &key) const;
  std::optional<std::string> error_message(const std::string &key) const;
  bool is_expired(const std::string &key) const;
  bool has_in_flight(const std::string &key) const;
  bool has_expired_entries() const;

  void put(const std::string &key, Value value, Ttl ttl);
  void set_error(const std::string &key, std::exception_ptr error);

  // Backdates a SUCCESS entry with a TTL so it reads as expired while its
  // value stays visible. Always notifies the dirty sink.
  void invalidate(const std::string &key);
  void invalidate_all();

  // Loader failures land in the ERROR state and never throw here.
  std::shared_future<Value> get_or_start_load(const std::string &key,
                                              Loader loader, Ttl ttl);

  bool discard(const std::string &key);
  void clear();

  std::size_t size() const;
  CacheStats stats() const;
  std::string info() const;

private:
  struct LoadingEntry {
    std::shared_future<Value> in_flight;
  };
  struct SuccessEntry {
    Value value;
    TimePoint loaded_at;
    Ttl ttl;
    // Valid only while a background revalidation runs.
    std::shared_future<Value> in_flight;
  };
  struct ErrorEntry {
    std::exception_ptr error;
  };
  // Alternative order matches CacheState.
  using Entry = std::variant<LoadingEntry, SuccessEntry, ErrorEntry>;

  struct Snapshot {
    std::optional<CacheState> state;
    Value value;
    std::exception_ptr error;
  };

  AsyncCache(std::shared_ptr<IExecutor> executor,
             std::shared_ptr<const IClock> clock, DirtySink on_change);

  Snapshot snapshot(const std::string &key) const;

  static bool expired(const Entry &entry, TimePoint now);
  static const std::shared_future<Value> *in_flight_of(const Entry &entry);
  void dispatch(const std::string &key, Loader loader, Ttl ttl,
                std::shared_ptr<std::promise<Value>> promise);
  void notify_dirty() const;

  std::shared_ptr<IExecutor> executor_;
  std::shared_ptr<const IClock> clock_;
  DirtySink on_change_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
  CacheStats stats_;
};

} // namespace panel_sync
