#include "panel_sync/host.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace panel_sync;

TEST_CASE("timers honour delay and period", "[host][timer]") {
  TickLoop loop;
  std::vector<std::uint64_t> fired;
  loop.run_timer(2, 3, [&] { fired.push_back(loop.current_tick()); });
  for (int i = 0; i < 9; ++i)
    loop.tick();
  CHECK(fired == std::vector<std::uint64_t>{2, 5, 8});
}

TEST_CASE("zero delay runs on the next tick and zero period runs once",
          "[host][timer]") {
  TickLoop loop;
  int runs = 0;
  loop.run_timer(0, 0, [&] { ++runs; });
  loop.tick();
  loop.tick();
  CHECK(runs == 1);
  CHECK(loop.timer_count() == 0);
}

TEST_CASE("a timer can cancel itself and others", "[host][cancel]") {
  TickLoop loop;
  int self_runs = 0;
  int other_runs = 0;
  TaskId other = 0;
  TaskId self = 0;
  self = loop.run_timer(1, 1, [&] {
    ++self_runs;
    loop.cancel(self);
    loop.cancel(other);
  });
  other = loop.run_timer(1, 1, [&] { ++other_runs; });
  loop.tick();
  loop.tick();
  CHECK(self_runs == 1);
  CHECK(other_runs == 0);
  CHECK(loop.timer_count() == 0);
}

TEST_CASE("posted tasks run on the next tick before timers", "[host][post]") {
  TickLoop loop;
  std::vector<std::string> order;
  loop.run_timer(1, 0, [&] { order.push_back("timer"); });
  bool poster_on_main = true;
  std::thread poster([&] {
    poster_on_main = loop.is_main_thread();
    loop.run_task([&] { order.push_back("posted"); });
  });
  poster.join();
  CHECK_FALSE(poster_on_main);
  CHECK(loop.is_main_thread());
  CHECK(loop.posted_count() == 1);
  loop.tick();
  CHECK(order == std::vector<std::string>{"posted", "timer"});
  CHECK(loop.posted_count() == 0);
}

TEST_CASE("a throwing task does not stop the tick", "[host][errors]") {
  TickLoop loop;
  int runs = 0;
  loop.run_task([] { throw std::runtime_error("boom"); });
  loop.run_timer(1, 1, [] { throw std::runtime_error("boom"); });
  loop.run_timer(1, 1, [] { throw 42; });
  loop.run_timer(1, 1, [&] { ++runs; });
  REQUIRE_NOTHROW(loop.tick());
  REQUIRE_NOTHROW(loop.tick());
  CHECK(runs == 2);
  CHECK(loop.timer_count() == 3);
}

TEST_CASE("main thread can be rebound", "[host][thread]") {
  TickLoop loop;
  bool on_main = true;
  std::thread other([&] {
    loop.bind_to_current_thread();
    on_main = loop.is_main_thread();
  });
  other.join();
  CHECK(on_main);
  CHECK_FALSE(loop.is_main_thread());
}
