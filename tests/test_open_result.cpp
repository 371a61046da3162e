#include "panel_sync/open_result.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace panel_sync;

TEST_CASE("open result arithmetic", "[open_result]") {
  auto r = OpenResult::timeout(Duration(3001), {"a", "b"}, {"c"}, {"d"});
  CHECK(r.success());
  CHECK(r.partial());
  CHECK(r.total() == 4);
  CHECK(r.success_rate() == 0.5);
  CHECK(r.describe() ==
        "OpenResult{status=TIMEOUT, elapsed=3001ms, success=2, failed=1, "
        "pending=1}");
}

TEST_CASE("results without awaited keys", "[open_result]") {
  auto imm = OpenResult::immediate();
  CHECK(imm.status() == OpenStatus::Immediate);
  CHECK(imm.fully_loaded());
  CHECK(imm.success_rate() == 1.0);

  auto off = OpenResult::viewer_offline(Duration(40));
  CHECK(off.failure());
  CHECK(to_string(off.status()) == "VIEWER_OFFLINE");

  auto err = OpenResult::error(
      Duration(5), std::make_exception_ptr(std::runtime_error("paint")));
  CHECK(err.failure());
  CHECK(err.error_ptr() != nullptr);
}
