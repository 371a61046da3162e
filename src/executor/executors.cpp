#include "panel_sync/executor.hpp"
#include "panel_sync/log.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace panel_sync {
namespace {

class InlineExecutor final : public IExecutor {
public:
  std::string name() const override { return "inline"; }
  void execute(Job job) override { job(); }
  std::size_t pending() const override { return 0; }
};

// Workers own the queue state. A worker that ends up destroying its own pool is
// detached and drains the queue alone.
class PoolExecutor final : public IExecutor {
public:
  explicit PoolExecutor(std::size_t threads)
      : shared_(std::make_shared<Shared>()) {
    if (threads == 0)
      threads = std::max(1u, std::thread::hardware_concurrency());
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i)
      workers_.emplace_back([shared = shared_] { worker_loop(*shared); });
    logger()->debug("pool executor started with {} workers", threads);
  }

  ~PoolExecutor() override {
    {
      std::lock_guard<std::mutex> lock(shared_->mu);
      shared_->stop = true;
    }
    shared_->cv.notify_all();
    const auto self = std::this_thread::get_id();
    for (auto &w : workers_) {
      if (!w.joinable())
        continue;
      if (w.get_id() == self)
        w.detach();
      else
        w.join();
    }
    logger()->debug("pool executor stopped");
  }

  PoolExecutor(const PoolExecutor &) = delete;
  PoolExecutor &operator=(const PoolExecutor &) = delete;

  std::string name() const override { return "pool"; }

  void execute(Job job) override {
    {
      std::lock_guard<std::mutex> lock(shared_->mu);
      if (shared_->stop)
        throw std::runtime_error("pool executor is shutting down");
      shared_->queue.push(std::move(job));
    }
    shared_->cv.notify_one();
  }

  std::size_t pending() const override {
    std::lock_guard<std::mutex> lock(shared_->mu);
    return shared_->queue.size();
  }

private:
  struct Shared {
    std::queue<Job> queue;
    std::mutex mu;
    std::condition_variable cv;
    bool stop{false};
  };

  static void worker_loop(Shared &shared) {
    for (;;) {
      Job job;
      {
        std::unique_lock<std::mutex> lock(shared.mu);
        shared.cv.wait(lock,
                       [&] { return shared.stop || !shared.queue.empty(); });
        // Every accepted job runs, even after stop.
        if (shared.queue.empty())
          return;
        job = std::move(shared.queue.front());
        shared.queue.pop();
      }
      try {
        job();
      } catch (const std::exception &e) {
        logger()->error("executor job failed: {}", e.what());
      } catch (...) {
        logger()->error("executor job failed with a non-standard exception");
      }
    }
  }

  std::shared_ptr<Shared> shared_;
  std::vector<std::thread> workers_;
};

} // namespace

std::shared_ptr<IExecutor> make_executor_by_name(const std::string &mode,
                                                 std::size_t threads) {
  if (mode == "inline")
    return std::make_shared<InlineExecutor>();
  return std::make_shared<PoolExecutor>(threads);
}

} // namespace panel_sync
