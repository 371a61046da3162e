#include "panel_sync/async_cache.hpp"
#include "panel_sync/executor.hpp"
#include "support/fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace panel_sync;
using namespace std::chrono_literals;

TEST_CASE("two callers share one slow load", "[single_flight]") {
  auto cache = AsyncCache::create(make_executor_by_name("pool", 4));
  std::atomic<int> calls{0};
  Loader slow = [&calls]() -> Value {
    calls.fetch_add(1);
    std::this_thread::sleep_for(100ms);
    return 7;
  };

  auto a = cache->get_or_start_load("x", slow, Duration(1s));
  auto b = cache->get_or_start_load("x", slow, Duration(1s));
  CHECK(std::any_cast<int>(a.get()) == 7);
  CHECK(std::any_cast<int>(b.get()) == 7);
  CHECK(calls.load() == 1);
  CHECK(cache->stats().joins == 1);
  CHECK(cache->get<int>("x") == 7);
}

TEST_CASE("concurrent callers on a cold key run the loader once",
          "[single_flight][threads]") {
  auto cache = AsyncCache::create(make_executor_by_name("pool", 4));
  std::atomic<int> calls{0};
  Loader loader = [&calls]() -> Value {
    calls.fetch_add(1);
    std::this_thread::sleep_for(50ms);
    return std::string("ready");
  };

  constexpr int threads = 16;
  std::atomic<bool> go{false};
  std::vector<std::shared_future<Value>> futures(threads);
  std::vector<std::thread> workers;
  for (int i = 0; i < threads; ++i) {
    workers.emplace_back([&, i] {
      while (!go.load())
        std::this_thread::yield();
      futures[i] = cache->get_or_start_load("cold", loader, Duration(60s));
    });
  }
  go.store(true);
  for (auto &w : workers)
    w.join();

  for (auto &f : futures)
    CHECK(std::any_cast<std::string>(f.get()) == "ready");
  CHECK(calls.load() == 1);
  const auto s = cache->stats();
  CHECK(s.loads == 1);
  CHECK(s.joins + s.hits == static_cast<std::uint64_t>(threads - 1));
}

TEST_CASE("concurrent failures are shared too", "[single_flight][error]") {
  auto cache = AsyncCache::create(make_executor_by_name("pool", 2));
  std::atomic<int> calls{0};
  Loader failing = [&calls]() -> Value {
    calls.fetch_add(1);
    std::this_thread::sleep_for(50ms);
    throw std::runtime_error("unavailable");
  };
  auto a = cache->get_or_start_load("k", failing, Duration(1s));
  auto b = cache->get_or_start_load("k", failing, Duration(1s));
  CHECK_THROWS_AS(a.get(), std::runtime_error);
  CHECK_THROWS_AS(b.get(), std::runtime_error);
  CHECK(calls.load() == 1);
  CHECK(cache->state("k") == CacheState::Error);
}

TEST_CASE("dropping the cache while its load writes back",
          "[single_flight][lifetime]") {
  panel_sync::testing::Latch in_sink;
  panel_sync::testing::Latch release;
  auto cache = AsyncCache::create(make_executor_by_name("pool", 1),
                                  system_clock(), [&] {
                                    in_sink.open();
                                    release.wait();
                                  });
  auto f = cache->get_or_start_load(
      "k", []() -> Value { return 3; }, Duration(1s));
  in_sink.wait();
  // The worker now holds the only reference to the cache and its pool.
  cache.reset();
  release.open();
  CHECK(std::any_cast<int>(f.get()) == 3);
}
