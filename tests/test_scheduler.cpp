#include "scheduler.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace ciwait;

TEST_CASE("scheduler switches to fast polling near the median") {
  PollScheduler s;
  s.fast_seconds = 5;
  s.slow_seconds = 30;
  s.fast_percent = 85;
  REQUIRE(s.next_sleep(84, 100, 3) == 30);
  REQUIRE(s.next_sleep(85, 100, 3) == 5);
  REQUIRE(s.next_sleep(500, 100, 3) == 5);
}

TEST_CASE("scheduler polls fast until checks appear") {
  PollScheduler s;
  REQUIRE(s.next_sleep(0, 0, 0) == s.fast_seconds);
  REQUIRE(s.next_sleep(0, 600, 0) == s.fast_seconds);
}

TEST_CASE("scheduler polls slowly without history") {
  PollScheduler s;
  REQUIRE(s.next_sleep(10000, 0, 4) == s.slow_seconds);
}
