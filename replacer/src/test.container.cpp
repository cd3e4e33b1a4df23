#include "replacer/container.h"

#include "catch2/catch.hpp"

#include <cstddef>

SCENARIO("interval map usage", "[container]") {
  GIVEN("An interval map from integers to booleans") {
    auto map = replacer::container::interval_map<int, bool>{ false };

    WHEN("it is default constructed") {
      THEN("it is canonical") {
        REQUIRE(map.is_canonical());
      }
      THEN("any value is false") {
        auto const any_value = 42;
        REQUIRE(map[any_value] == false);
      }
    }

    WHEN("an interval is assigned") {
      map.assign(10, 20, true);

      THEN("keys inside the interval map to the new value") {
        REQUIRE(map[10]);
        REQUIRE(map[19]);
      }
      THEN("keys outside keep the initial value") {
        REQUIRE(not map[9]);
        REQUIRE(not map[20]);
      }
      THEN("the interval starts at its first key") {
        REQUIRE(map.lower_key(15) == 10);
      }

      AND_WHEN("an adjacent interval with the same value is assigned") {
        map.assign(20, 30, true);

        THEN("both intervals are merged") {
          REQUIRE(map.is_canonical());
          REQUIRE(map.interval_count() == 3);
          REQUIRE(map.lower_key(25) == 10);
        }
      }

      AND_WHEN("an overlapping interval with the initial value is assigned") {
        map.assign(15, 30, false);

        THEN("the first interval is cut short") {
          REQUIRE(map.is_canonical());
          REQUIRE(map.interval_count() == 3);
          REQUIRE(map[14]);
          REQUIRE(not map[15]);
          REQUIRE(map.lower_key(16) == 15);
        }
      }

      AND_WHEN("an interval covering it is assigned") {
        map.assign(5, 25, true);

        THEN("both boundaries move") {
          REQUIRE(map.is_canonical());
          REQUIRE(map.interval_count() == 3);
          REQUIRE(map.lower_key(19) == 5);
          REQUIRE(not map[25]);
        }
      }
    }

    WHEN("an empty interval is assigned") {
      map.assign(5, 5, true);

      THEN("nothing changes") {
        REQUIRE(not map[5]);
        REQUIRE(map.interval_count() == 1);
      }
    }
  }

  GIVEN("An interval map from offsets to run indices") {
    auto map = replacer::container::interval_map<std::size_t, std::size_t>{ 99 };

    map.assign(0, 3, 0);
    map.assign(3, 5, 1);

    THEN("each offset knows its run and where the run begins") {
      REQUIRE(map[2] == 0);
      REQUIRE(map[3] == 1);
      REQUIRE(map.lower_key(4) == 3);
      REQUIRE(map[5] == 99);
    }
  }
}
