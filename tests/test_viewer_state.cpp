#include "panel_sync/reactive_loader.hpp"
#include "panel_sync/viewer_state.hpp"
#include "support/fakes.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace panel_sync;
using panel_sync::testing::FakeViewer;
using panel_sync::testing::ManualExecutor;

TEST_CASE("cache writes mark the viewer dirty", "[viewer][dirty]") {
  auto clock = std::make_shared<ManualClock>();
  ViewerState state(std::make_shared<FakeViewer>("v1"),
                    make_executor_by_name("inline"), clock);
  CHECK_FALSE(state.dirty());
  state.cache().put("k", 1, std::nullopt);
  CHECK(state.consume_dirty());
  CHECK_FALSE(state.consume_dirty());

  state.set_value("page", 2);
  CHECK(state.consume_dirty());
  CHECK(state.value_or<int>("page", 0) == 2);
  CHECK(state.value_or<std::string>("page", "none") == "none");
  CHECK(state.has_value("page"));
  state.remove_value("page");
  CHECK_FALSE(state.has_value("page"));
}

TEST_CASE("refresh interval bookkeeping", "[viewer][interval]") {
  auto clock = std::make_shared<ManualClock>();
  ViewerState state(std::make_shared<FakeViewer>("v1"),
                    make_executor_by_name("inline"), clock);
  CHECK(state.interval_elapsed(Duration(100)));
  state.record_refresh();
  CHECK_FALSE(state.interval_elapsed(Duration(100)));
  clock->advance(Duration(101));
  CHECK(state.interval_elapsed(Duration(100)));
}

TEST_CASE("late load completion outlives the viewer state",
          "[viewer][lifetime]") {
  auto executor = std::make_shared<ManualExecutor>();
  auto state = std::make_shared<ViewerState>(
      std::make_shared<FakeViewer>("v1"), executor);
  auto f = state->cache().get_or_start_load(
      "k", []() -> Value { return 1; }, Duration(1000));
  state.reset();
  executor->run_all();
  CHECK(std::any_cast<int>(f.get()) == 1);
}

TEST_CASE("registry add, find, remove", "[viewer][registry]") {
  ViewerRegistry reg;
  auto ex = make_executor_by_name("inline");
  CHECK(reg.add(std::make_shared<ViewerState>(
      std::make_shared<FakeViewer>("a"), ex)));
  CHECK_FALSE(reg.add(std::make_shared<ViewerState>(
      std::make_shared<FakeViewer>("a"), ex)));
  CHECK(reg.size() == 1);
  CHECK(reg.find("a") != nullptr);
  CHECK(reg.remove("a") != nullptr);
  CHECK(reg.remove("a") == nullptr);
  CHECK(reg.empty());
}

TEST_CASE("reactive sources load each key once", "[viewer][reactive]") {
  auto executor = std::make_shared<ManualExecutor>();
  ViewerState state(std::make_shared<FakeViewer>("v1", "Alice"), executor,
                    std::make_shared<ManualClock>());
  ReactiveLoader sources;
  sources.add("name", [](const IViewer &v) -> Value { return v.name(); },
              Duration(1000));
  sources.add("level", [](const IViewer &) -> Value { return 1; },
              std::nullopt);
  sources.add("level", [](const IViewer &) -> Value { return 5; },
              std::nullopt);
  CHECK(sources.keys() == std::vector<std::string>{"name", "level"});

  sources.trigger(state);
  sources.trigger(state);
  CHECK(executor->pending() == 2);
  executor->run_all();
  CHECK(state.cache().get<std::string>("name") == "Alice");
  CHECK(state.cache().get<int>("level") == 5);

  sources.trigger(state);
  CHECK(executor->pending() == 0);
  CHECK_THROWS_AS(sources.add("bad", nullptr, std::nullopt),
                  std::invalid_argument);
}
