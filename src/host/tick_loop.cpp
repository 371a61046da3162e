#include "panel_sync/host.hpp"
#include "panel_sync/log.hpp"

#include <algorithm>

namespace panel_sync {

TickLoop::TickLoop() : main_thread_(std::this_thread::get_id()) {}

TaskId TickLoop::run_timer(std::uint64_t delay_ticks,
                           std::uint64_t period_ticks, Task task) {
  std::lock_guard<std::mutex> lock(timers_mu_);
  const TaskId id = next_id_++;
  timers_[id] = {std::move(task),
                 tick_ + std::max<std::uint64_t>(1, delay_ticks),
                 period_ticks};
  return id;
}

void TickLoop::cancel(TaskId id) {
  std::lock_guard<std::mutex> lock(timers_mu_);
  timers_.erase(id);
}

void TickLoop::run_task(Task task) {
  std::lock_guard<std::mutex> lock(posted_mu_);
  posted_.push_back(std::move(task));
}

bool TickLoop::is_main_thread() const {
  return main_thread_.load() == std::this_thread::get_id();
}

void TickLoop::bind_to_current_thread() {
  main_thread_.store(std::this_thread::get_id());
}

void TickLoop::tick() {
  std::vector<Task> posted;
  {
    std::lock_guard<std::mutex> lock(posted_mu_);
    posted.swap(posted_);
  }
  std::vector<TaskId> due;
  {
    std::lock_guard<std::mutex> lock(timers_mu_);
    ++tick_;
    for (const auto &[id, timer] : timers_) {
      if (timer.next_tick <= tick_)
        due.push_back(id);
    }
  }

  for (const auto &task : posted)
    run_guarded(task);

  for (const auto id : due) {
    Task task;
    {
      std::lock_guard<std::mutex> lock(timers_mu_);
      auto it = timers_.find(id);
      // Cancelled by an earlier task in this tick.
      if (it == timers_.end())
        continue;
      task = it->second.task;
      if (it->second.period == 0)
        timers_.erase(it);
      else
        it->second.next_tick = tick_ + it->second.period;
    }
    run_guarded(task);
  }
}

std::size_t TickLoop::timer_count() const {
  std::lock_guard<std::mutex> lock(timers_mu_);
  return timers_.size();
}

std::size_t TickLoop::posted_count() const {
  std::lock_guard<std::mutex> lock(posted_mu_);
  return posted_.size();
}

void TickLoop::run_guarded(const Task &task) {
  try {
    task();
  } catch (const std::exception &e) {
    logger()->error("host task failed: {}", e.what());
  } catch (...) {
    logger()->error("host task failed with a non-standard exception");
  }
}

} // namespace panel_sync
