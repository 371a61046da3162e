#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace panel_sync {

using Task = std::function<void()>;
using TaskId = std::uint64_t;

class IHostScheduler {
public:
  virtual ~IHostScheduler() = default;

  // First run after `delay_ticks` (at least one), then every `period_ticks`;
  // a zero period runs once.
  virtual TaskId run_timer(std::uint64_t delay_ticks,
                           std::uint64_t period_ticks, Task task) = 0;
  virtual void cancel(TaskId id) = 0;
  // Runs `task` on the render thread at the next tick. Any thread may call.
  virtual void run_task(Task task) = 0;
  virtual bool is_main_thread() const = 0;
};

class TickLoop final : public IHostScheduler {
public:
  TickLoop();

  TaskId run_timer(std::uint64_t delay_ticks, std::uint64_t period_ticks,
                   Task task) override;
  void cancel(TaskId id) override;
  void run_task(Task task) override;
  bool is_main_thread() const override;

  void bind_to_current_thread();

  void tick();

  std::uint64_t current_tick() const { return tick_; }
  std::size_t timer_count() const;
  std::size_t posted_count() const;

private:
  struct Timer {
    Task task;
    std::uint64_t next_tick{0};
    std::uint64_t period{0};
  };

  static void run_guarded(const Task &task);

  std::atomic<std::thread::id> main_thread_;
  std::uint64_t tick_{0};
  TaskId next_id_{1};
  mutable std::mutex timers_mu_;
  std::map<TaskId, Timer> timers_;
  mutable std::mutex posted_mu_;
  std::vector<Task> posted_;
};

} // namespace panel_sync
