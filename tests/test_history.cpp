#include "history.hpp"
#include "state_store.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace ciwait;

TEST_CASE("median estimate picks the low middle") {
  REQUIRE(median_estimate({1, 2, 3, 4}) == 2);
  REQUIRE(median_estimate({5}) == 5);
  REQUIRE(median_estimate({}) == 0);
  REQUIRE(median_estimate({1, 2, 3, 4, 5}) == 2);
  REQUIRE(median_estimate({40, 10, 30, 20}) == 20);
}

TEST_CASE("history keeps the newest entries") {
  SqliteStateStore store(":memory:");
  RollingHistoryStore history(store, 3);
  for (RunDuration d : {10, 20, 30, 40}) {
    history.update(Category::Success, d, false);
  }
  REQUIRE(history.fetch(Category::Success) == RollingHistory{20, 30, 40});
  REQUIRE(store.get("rolling-elapsed-success") == "20 30 40");
  REQUIRE(history.fetch(Category::Failure).empty());
}

TEST_CASE("history update returns the new median on request") {
  SqliteStateStore store(":memory:");
  RollingHistoryStore history(store);
  REQUIRE_FALSE(history.update(Category::Failure, 100, false).has_value());
  auto median = history.update(Category::Failure, 50, true);
  REQUIRE(median.has_value());
  REQUIRE(*median == 50);
  REQUIRE(history.median(Category::Failure) == 50);
}

TEST_CASE("history without a duration leaves storage alone") {
  SqliteStateStore store(":memory:");
  store.set("rolling-elapsed-success", "30 10 20");
  RollingHistoryStore history(store);
  auto median = history.update(Category::Success, std::nullopt, true);
  REQUIRE(median == 10);
  REQUIRE_FALSE(
      history.update(Category::Success, std::nullopt, false).has_value());
  REQUIRE(store.get("rolling-elapsed-success") == "30 10 20");
}

TEST_CASE("history with zero capacity is disabled") {
  SqliteStateStore store(":memory:");
  RollingHistoryStore history(store, 0);
  REQUIRE(history.update(Category::Success, 90, true) == 0);
  REQUIRE_FALSE(history.update(Category::Success, 90, false).has_value());
  REQUIRE_FALSE(store.get("rolling-elapsed-success").has_value());
}

TEST_CASE("history skips malformed entries") {
  SqliteStateStore store(":memory:");
  store.set("rolling-elapsed-success", "12 abc -5 7.5 30");
  RollingHistoryStore history(store);
  REQUIRE(history.fetch(Category::Success) == RollingHistory{12, 30});
}

TEST_CASE("history clear removes one category") {
  SqliteStateStore store(":memory:");
  RollingHistoryStore history(store);
  history.update(Category::Success, 60, false);
  history.update(Category::Failure, 70, false);
  history.clear(Category::Success);
  history.clear(Category::Success);
  REQUIRE(history.fetch(Category::Success).empty());
  REQUIRE(history.fetch(Category::Failure) == RollingHistory{70});
}

TEST_CASE("history fetch honours a reduced capacity") {
  SqliteStateStore store(":memory:");
  store.set("rolling-elapsed-failure", "1 2 3 4 5");
  RollingHistoryStore history(store, 2);
  REQUIRE(history.fetch(Category::Failure) == RollingHistory{4, 5});
}
