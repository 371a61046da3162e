#include "panel_sync/async_cache.hpp"
#include "panel_sync/viewer_state.hpp"
#include "support/fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

using namespace panel_sync;
using panel_sync::testing::FakeViewer;
using panel_sync::testing::ManualExecutor;
using namespace std::chrono_literals;

TEST_CASE("computed reflects all four cache states", "[computed][cache]") {
  auto executor = std::make_shared<ManualExecutor>();
  auto clock = std::make_shared<ManualClock>();
  auto cache = AsyncCache::create(executor, clock);

  auto none = cache->computed<int>("k");
  CHECK(none.is_empty());
  CHECK(none.state() == ComputedState::Empty);
  CHECK(none.value_or(-1) == -1);

  cache->get_or_start_load("k", []() -> Value { return 7; }, Duration(1s));
  auto pending = cache->computed<int>("k");
  CHECK(pending.is_loading());
  CHECK_FALSE(pending.to_optional().has_value());

  executor->run_all();
  auto ready = cache->computed<int>("k");
  REQUIRE(ready.is_present());
  CHECK(ready.value_or(0) == 7);

  // Stale values stay present.
  clock->advance(Duration(2s));
  CHECK(cache->computed<int>("k").value_or(0) == 7);

  cache->set_error("k", std::make_exception_ptr(std::runtime_error("down")));
  auto failed = cache->computed<int>("k");
  CHECK(failed.is_error());
  CHECK(failed.error_message() == "down");
  CHECK(failed.value_or(0) == 0);
}

TEST_CASE("computed with the wrong type is an error", "[computed][cache]") {
  auto cache = AsyncCache::create(make_executor_by_name("inline"));
  cache->put("k", std::string("text"), std::nullopt);
  auto wrong = cache->computed<int>("k");
  REQUIRE(wrong.is_error());
  CHECK_THROWS_AS(std::rethrow_exception(wrong.error_ptr()),
                  std::bad_any_cast);
  CHECK(cache->computed<Value>("k").is_present());
}

TEST_CASE("map transforms success and passes other states through",
          "[computed][map]") {
  auto doubled = Computed<int>::success(21).map([](int v) { return v * 2; });
  CHECK(doubled.value_or(0) == 42);

  auto label = Computed<int>::success(3).map(
      [](int v) { return "x" + std::to_string(v); });
  CHECK(label.value_or("") == "x3");

  CHECK(Computed<int>::loading().map([](int v) { return v; }).is_loading());
  CHECK(Computed<int>::empty().map([](int v) { return v; }).is_empty());
  auto err = Computed<int>::error(
      std::make_exception_ptr(std::runtime_error("bad")));
  CHECK(err.map([](int v) { return v; }).error_message() == "bad");

  auto thrown = Computed<int>::success(1).map([](int) -> int {
    throw std::out_of_range("no slot");
  });
  CHECK(thrown.is_error());
  CHECK(thrown.error_message() == "no slot");
}

TEST_CASE("loading and error fallbacks become values", "[computed][fallback]") {
  CHECK(Computed<int>::loading().on_loading(5).value_or(0) == 5);
  CHECK(Computed<int>::loading().on_error(5).is_loading());
  auto err = Computed<int>::error(
      std::make_exception_ptr(std::runtime_error("bad")));
  CHECK(err.on_error(9).value_or(0) == 9);
  CHECK(Computed<int>::success(1).on_loading(5).value_or(0) == 1);
}

TEST_CASE("viewer state exposes computed reads", "[computed][viewer]") {
  ViewerState state(std::make_shared<FakeViewer>("v1"),
                    make_executor_by_name("inline"));
  state.cache().put("coins", 12, std::nullopt);
  CHECK(state.computed<int>("coins").value_or(0) == 12);
  CHECK(state.computed<int>("gems").is_empty());
}
