#include "panel_sync/initial_load_gate.hpp"
#include "panel_sync/log.hpp"

#include <stdexcept>

namespace panel_sync {

std::shared_ptr<InitialLoadGate>
InitialLoadGate::create(IHostScheduler &host, std::shared_ptr<ViewerState> state,
                        std::vector<std::string> keys, Duration max_wait,
                        Callbacks callbacks,
                        std::shared_ptr<const IClock> clock) {
  if (!state)
    throw std::invalid_argument("InitialLoadGate requires a viewer state");
  if (!clock)
    clock = system_clock();
  return std::shared_ptr<InitialLoadGate>(
      new InitialLoadGate(host, std::move(state), std::move(keys), max_wait,
                          std::move(callbacks), std::move(clock)));
}

InitialLoadGate::InitialLoadGate(IHostScheduler &host,
                                 std::shared_ptr<ViewerState> state,
                                 std::vector<std::string> keys,
                                 Duration max_wait, Callbacks callbacks,
                                 std::shared_ptr<const IClock> clock)
    : host_(host), state_(std::move(state)), keys_(std::move(keys)),
      max_wait_(max_wait), callbacks_(std::move(callbacks)),
      clock_(std::move(clock)) {}

void InitialLoadGate::start() {
  if (started_)
    return;
  started_ = true;
  started_at_ = clock_->now();
  // The timer owns the gate until polling stops.
  auto self = shared_from_this();
  timer_ = host_.run_timer(0, 1, [self] { self->poll(); });
  logger()->debug("waiting for {} keys before opening for {}", keys_.size(),
                  state_->viewer()->name());
}

void InitialLoadGate::poll() {
  if (finished_)
    return;
  const auto waited = elapsed();
  const auto &viewer = *state_->viewer();

  if (!viewer.online()) {
    stop_polling();
    if (callbacks_.discard)
      callbacks_.discard();
    complete(OpenResult::viewer_offline(waited));
    return;
  }

  std::set<std::string> successful;
  std::set<std::string> failed;
  std::set<std::string> pending;
  for (const auto &key : keys_) {
    const auto st = state_->cache().state(key);
    if (st == CacheState::Success)
      successful.insert(key);
    else if (st == CacheState::Error)
      failed.insert(key);
    else
      pending.insert(key);
  }

  if (waited > max_wait_) {
    logger()->warn("open timeout for {} after {}ms (timeout: {}ms), {} keys "
                   "still pending",
                   viewer.name(), waited.count(), max_wait_.count(),
                   pending.size());
    stop_polling();
    paint_and_complete(OpenResult::timeout(waited, std::move(successful),
                                           std::move(failed),
                                           std::move(pending)));
    return;
  }

  if (pending.empty()) {
    stop_polling();
    paint_and_complete(OpenResult::preloaded(waited, std::move(successful),
                                             std::move(failed)));
  }
}

void InitialLoadGate::cancel() {
  cancelled_ = true;
  if (!finished_)
    stop_polling();
}

void InitialLoadGate::stop_polling() {
  finished_ = true;
  if (timer_.has_value()) {
    host_.cancel(*timer_);
    timer_.reset();
  }
}

void InitialLoadGate::paint_and_complete(OpenResult result) {
  if (!host_.is_main_thread()) {
    host_.run_task([self = shared_from_this(), result = std::move(result)] {
      self->paint_and_complete(result);
    });
    return;
  }
  if (cancelled_)
    return;
  try {
    if (callbacks_.paint)
      callbacks_.paint();
  } catch (const std::exception &e) {
    logger()->warn("initial paint failed for {}: {}",
                   state_->viewer()->name(), e.what());
    complete(OpenResult::error(result.elapsed(), std::current_exception()));
    return;
  } catch (...) {
    logger()->warn("initial paint failed for {}", state_->viewer()->name());
    complete(OpenResult::error(result.elapsed(), std::current_exception()));
    return;
  }
  complete(result);
}

void InitialLoadGate::complete(const OpenResult &result) {
  logger()->debug("open for {} finished: {}", state_->viewer()->name(),
                  result.describe());
  if (callbacks_.on_done)
    callbacks_.on_done(result);
}

Duration InitialLoadGate::elapsed() const {
  if (!started_)
    return Duration::zero();
  return std::chrono::duration_cast<Duration>(clock_->now() - started_at_);
}

} // namespace panel_sync
