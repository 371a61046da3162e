#include "panel_sync/async_cache.hpp"
#include "panel_sync/log.hpp"

#include <sstream>
#include <stdexcept>

namespace panel_sync {
namespace {
std::shared_future<Value> ready_future(const Value &value) {
  std::promise<Value> p;
  p.set_value(value);
  return p.get_future().share();
}

bool is_ready(const std::shared_future<Value> &f) {
  return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}
} // namespace

std::string to_string(CacheState state) {
  switch (state) {
  case CacheState::Loading:
    return "LOADING";
  case CacheState::Success:
    return "SUCCESS";
  case CacheState::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

std::shared_ptr<AsyncCache>
AsyncCache::create(std::shared_ptr<IExecutor> executor,
                   std::shared_ptr<const IClock> clock, DirtySink on_change) {
  if (!executor)
    throw std::invalid_argument("AsyncCache requires an executor");
  if (!clock)
    clock = system_clock();
  return std::shared_ptr<AsyncCache>(
      new AsyncCache(std::move(executor), std::move(clock), std::move(on_change)));
}

AsyncCache::AsyncCache(std::shared_ptr<IExecutor> executor,
                       std::shared_ptr<const IClock> clock, DirtySink on_change)
    : executor_(std::move(executor)), clock_(std::move(clock)),
      on_change_(std::move(on_change)) {}

std::optional<Value> AsyncCache::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  if (const auto *ok = std::get_if<SuccessEntry>(&it->second))
    return ok->value;
  return std::nullopt;
}

std::optional<CacheState> AsyncCache::state(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  return static_cast<CacheState>(it->second.index());
}

std::optional<std::exception_ptr>
AsyncCache::error(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  if (const auto *failed = std::get_if<ErrorEntry>(&it->second))
    return failed->error;
  return std::nullopt;
}

std::optional<std::string>
AsyncCache::error_message(const std::string &key) const {
  auto err = error(key);
  if (!err.has_value() || !*err)
    return std::nullopt;
  try {
    std::rethrow_exception(*err);
  } catch (const std::exception &e) {
    return std::string(e.what());
  } catch (...) {
    return std::string("unknown error");
  }
}

AsyncCache::Snapshot AsyncCache::snapshot(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  Snapshot snap;
  auto it = entries_.find(key);
  if (it == entries_.end())
    return snap;
  snap.state = static_cast<CacheState>(it->second.index());
  if (const auto *ok = std::get_if<SuccessEntry>(&it->second))
    snap.value = ok->value;
  else if (const auto *failed = std::get_if<ErrorEntry>(&it->second))
    snap.error = failed->error;
  return snap;
}

bool AsyncCache::is_expired(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  return it == entries_.end() || expired(it->second, clock_->now());
}

bool AsyncCache::has_in_flight(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return false;
  const auto *f = in_flight_of(it->second);
  return f != nullptr && f->valid();
}

bool AsyncCache::has_expired_entries() const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = clock_->now();
  for (const auto &[k, e] : entries_) {
    if (expired(e, now))
      return true;
  }
  return false;
}

void AsyncCache::put(const std::string &key, Value value, Ttl ttl) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.insert_or_assign(
        key, SuccessEntry{std::move(value), clock_->now(), ttl, {}});
  }
  notify_dirty();
}

void AsyncCache::set_error(const std::string &key, std::exception_ptr error) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.insert_or_assign(key, ErrorEntry{std::move(error)});
    ++stats_.errors;
  }
  notify_dirty();
}

void AsyncCache::invalidate(const std::string &key) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      const auto *ok = std::get_if<SuccessEntry>(&it->second);
      if (ok != nullptr && ok->ttl.has_value()) {
        const auto backdated =
            clock_->now() - *ok->ttl - std::chrono::seconds(1);
        it->second = SuccessEntry{ok->value, backdated, ok->ttl, ok->in_flight};
      }
    }
  }
  notify_dirty();
}

void AsyncCache::invalidate_all() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto now = clock_->now();
    for (auto &[k, e] : entries_) {
      const auto *ok = std::get_if<SuccessEntry>(&e);
      if (ok == nullptr || !ok->ttl.has_value())
        continue;
      e = SuccessEntry{ok->value, now - *ok->ttl - std::chrono::seconds(1),
                       ok->ttl, ok->in_flight};
    }
  }
  notify_dirty();
}

std::shared_future<Value> AsyncCache::get_or_start_load(const std::string &key,
                                                        Loader loader,
                                                        Ttl ttl) {
  auto promise = std::make_shared<std::promise<Value>>();
  std::shared_future<Value> result;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      const auto *running = in_flight_of(it->second);
      if (running != nullptr && running->valid() && !is_ready(*running)) {
        ++stats_.joins;
        return *running;
      }
      if (const auto *ok = std::get_if<SuccessEntry>(&it->second)) {
        if (!expired(it->second, clock_->now())) {
          ++stats_.hits;
          return ready_future(ok->value);
        }
        result = promise->get_future().share();
        it->second = SuccessEntry{ok->value, ok->loaded_at, ok->ttl, result};
        ++stats_.revalidations;
      }
    }
    if (!result.valid()) {
      result = promise->get_future().share();
      entries_.insert_or_assign(key, LoadingEntry{result});
      ++stats_.loads;
    }
  }
  dispatch(key, std::move(loader), ttl, std::move(promise));
  return result;
}

bool AsyncCache::discard(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.erase(key) > 0;
}

void AsyncCache::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
}

std::size_t AsyncCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

CacheStats AsyncCache::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

std::string AsyncCache::info() const {
  std::size_t loading = 0;
  std::size_t success = 0;
  std::size_t failed = 0;
  std::size_t stale = 0;
  CacheStats s;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto now = clock_->now();
    for (const auto &[k, e] : entries_) {
      switch (static_cast<CacheState>(e.index())) {
      case CacheState::Loading:
        ++loading;
        break;
      case CacheState::Success:
        ++success;
        if (expired(e, now))
          ++stale;
        break;
      case CacheState::Error:
        ++failed;
        break;
      }
    }
    s = stats_;
  }
  std::ostringstream os;
  os << "executor:" << executor_->name() << "\n";
  os << "keys:" << (loading + success + failed) << "\n";
  os << "loading:" << loading << "\n";
  os << "success:" << success << "\n";
  os << "stale:" << stale << "\n";
  os << "error:" << failed << "\n";
  os << "hits:" << s.hits << "\n";
  os << "joins:" << s.joins << "\n";
  os << "loads:" << s.loads << "\n";
  os << "revalidations:" << s.revalidations << "\n";
  os << "errors:" << s.errors << "\n";
  return os.str();
}

bool AsyncCache::expired(const Entry &entry, TimePoint now) {
  const auto *ok = std::get_if<SuccessEntry>(&entry);
  if (ok == nullptr || !ok->ttl.has_value())
    return false;
  return now > ok->loaded_at + *ok->ttl;
}

const std::shared_future<Value> *AsyncCache::in_flight_of(const Entry &entry) {
  if (const auto *loading = std::get_if<LoadingEntry>(&entry))
    return &loading->in_flight;
  if (const auto *ok = std::get_if<SuccessEntry>(&entry))
    return &ok->in_flight;
  return nullptr;
}

void AsyncCache::dispatch(const std::string &key, Loader loader, Ttl ttl,
                          std::shared_ptr<std::promise<Value>> promise) {
  std::weak_ptr<AsyncCache> weak = weak_from_this();
  auto job = [weak, key, loader = std::move(loader), ttl, promise]() {
    Value value;
    std::exception_ptr failure;
    try {
      value = loader();
    } catch (...) {
      failure = std::current_exception();
    }
    // Write back before resolving so a woken waiter sees the new entry.
    if (auto self = weak.lock()) {
      if (failure)
        self->set_error(key, failure);
      else
        self->put(key, value, ttl);
    }
    if (failure)
      promise->set_exception(failure);
    else
      promise->set_value(std::move(value));
  };
  try {
    executor_->execute(std::move(job));
  } catch (const std::exception &e) {
    logger()->error("executor {} rejected load for key {}: {}",
                    executor_->name(), key, e.what());
    auto failure = std::current_exception();
    set_error(key, failure);
    promise->set_exception(failure);
  }
}

void AsyncCache::notify_dirty() const {
  if (on_change_)
    on_change_();
}

} // namespace panel_sync
