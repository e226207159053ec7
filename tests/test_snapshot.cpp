#include "snapshot.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace ciwait;

TEST_CASE("snapshot counts check states") {
  const std::string rows = "build\tpass\t3m 10s\thttps://ci/1\n"
                           "lint\tpending\t0s\thttps://ci/2\n"
                           "test\tfail\t1m 02s\thttps://ci/3\n"
                           "docs\tskipping\t1s\thttps://ci/4\n";
  auto snap = parse_snapshot(rows);
  REQUIRE(snap.total == 4);
  REQUIRE(snap.passed == 1);
  REQUIRE(snap.pending == 1);
  REQUIRE(snap.failed == 1);
  REQUIRE(snap.longest_elapsed == 190);
}

TEST_CASE("snapshot status matching rules") {
  auto snap = parse_snapshot("a\tPASS\t1s\n"
                             "b\tFailure\t1s\n"
                             "c\tPending\t1s\n"
                             "d\tpending\t1s\n");
  REQUIRE(snap.total == 4);
  REQUIRE(snap.passed == 1);
  REQUIRE(snap.failed == 1);
  // Only the exact lowercase token counts as pending.
  REQUIRE(snap.pending == 1);
}

TEST_CASE("snapshot ignores short rows and empty output") {
  auto empty = parse_snapshot("");
  REQUIRE(empty.total == 0);
  REQUIRE(empty.pending == 0);
  REQUIRE(empty.longest_elapsed == 0);

  auto junk = parse_snapshot("no checks reported on the 'main' branch\n\n");
  REQUIRE(junk.total == 0);

  auto crlf = parse_snapshot("a\tpass\t5s\r\n");
  REQUIRE(crlf.total == 1);
  REQUIRE(crlf.longest_elapsed == 5);
}

TEST_CASE("snapshot longest duration uses version ordering") {
  auto snap = parse_snapshot("a\tpass\t9m 59s\n"
                             "b\tpass\t10m 01s\n"
                             "c\tpass\t2m 00s\n");
  REQUIRE(snap.longest_elapsed == 601);
}

TEST_CASE("version_compare orders digit runs numerically") {
  REQUIRE(version_compare("10m", "9m") > 0);
  REQUIRE(version_compare("9m", "10m") < 0);
  REQUIRE(version_compare("1m 05s", "1m 5s") == 0);
  REQUIRE(version_compare("1m 10s", "1m 09s") > 0);
  REQUIRE(version_compare("abc", "abd") < 0);
  REQUIRE(version_compare("1m", "1m 1s") < 0);
  REQUIRE(version_compare("", "") == 0);
}
