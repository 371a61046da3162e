#include "panel_sync/executor.hpp"
#include "support/fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace panel_sync;
using namespace std::chrono_literals;

TEST_CASE("executor factory picks by name", "[executor][factory]") {
  CHECK(make_executor_by_name("inline")->name() == "inline");
  CHECK(make_executor_by_name("pool", 2)->name() == "pool");
  CHECK(make_executor_by_name("anything", 1)->name() == "pool");
}

TEST_CASE("inline executor runs on the caller", "[executor][inline]") {
  auto ex = make_executor_by_name("inline");
  const auto caller = std::this_thread::get_id();
  std::thread::id ran_on;
  ex->execute([&] { ran_on = std::this_thread::get_id(); });
  CHECK(ran_on == caller);
  CHECK(ex->pending() == 0);
}

TEST_CASE("pool survives throwing jobs", "[executor][pool][errors]") {
  std::atomic<int> done{0};
  {
    auto ex = make_executor_by_name("pool", 1);
    ex->execute([] { throw std::logic_error("bad"); });
    ex->execute([] { throw 42; });
    ex->execute([&] { ++done; });
  }
  CHECK(done.load() == 1);
}

TEST_CASE("pool destroyed from its own worker finishes cleanly",
          "[executor][pool][lifetime]") {
  panel_sync::testing::Latch released;
  std::atomic<bool> ran{false};
  auto ex = make_executor_by_name("pool", 1);
  auto *raw = ex.get();
  // The queued job holds the last reference once the test lets go.
  raw->execute([owned = ex, &released] { released.wait(); });
  raw->execute([&] { ran = true; });
  ex.reset();
  released.open();
  for (int i = 0; i < 200 && !ran.load(); ++i)
    std::this_thread::sleep_for(5ms);
  CHECK(ran.load());
}

TEST_CASE("pool runs queued jobs before shutting down", "[executor][pool]") {
  std::atomic<int> done{0};
  panel_sync::testing::Latch latch;
  {
    auto ex = make_executor_by_name("pool", 1);
    ex->execute([&] {
      latch.wait();
      ++done;
    });
    for (int i = 0; i < 10; ++i)
      ex->execute([&] { ++done; });
    CHECK(ex->pending() >= 9);
    latch.open();
  }
  CHECK(done.load() == 11);
}

TEST_CASE("pool bounds concurrency to its worker count",
          "[executor][pool]") {
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::atomic<int> done{0};
  {
    auto ex = make_executor_by_name("pool", 3);
    for (int i = 0; i < 12; ++i) {
      ex->execute([&] {
        const int now = ++running;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(10ms);
        --running;
        ++done;
      });
    }
  }
  CHECK(done.load() == 12);
  CHECK(peak.load() <= 3);
  CHECK(peak.load() >= 1);
}
