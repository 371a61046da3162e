#pragma once

#include "panel_sync/types.hpp"

#include <atomic>
#include <memory>

namespace panel_sync {

class IClock {
public:
  virtual ~IClock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock final : public IClock {
public:
  TimePoint now() const override { return Clock::now(); }
};

// Time only moves when advance() is called. Safe to read from worker threads.
class ManualClock final : public IClock {
public:
  ManualClock() : base_(Clock::now()) {}

  TimePoint now() const override {
    return base_ + Duration(offset_ms_.load(std::memory_order_acquire));
  }
  void advance(Duration d) {
    offset_ms_.fetch_add(d.count(), std::memory_order_acq_rel);
  }

private:
  TimePoint base_;
  std::atomic<Duration::rep> offset_ms_{0};
};

std::shared_ptr<const IClock> system_clock();

} // namespace panel_sync
