#include "replacer/output.h"

#include "catch2/catch.hpp"
#include "test.fixtures.h"

#include <sstream>

SCENARIO("summarizing slides", "[output]") {
  GIVEN("A deck with two slides") {
    auto const deck = fixtures::greeting_deck();

    WHEN("it is summarized") {
      auto const rows = replacer::output::summarize(deck);

      THEN("there is one row per paragraph") {
        REQUIRE(rows.size() == 5);
        REQUIRE(rows[0].slide == 1);
        REQUIRE(rows[3].slide == 2);
        REQUIRE(rows[3].shape == "Content Placeholder 2");
        REQUIRE(rows[3].paragraph == 2);
        REQUIRE(rows[3].runs == 2);
        REQUIRE(rows[3].text == "hello person. ");
      }
    }

    WHEN("it is printed") {
      auto out = std::ostringstream{};
      replacer::output::print(out, deck);

      THEN("runs are shown in brackets and the current slide is marked") {
        REQUIRE(out.str().find("2*\tContent Placeholder 2\t2\t[hello ][person. ]\n") != std::string::npos);
        REQUIRE(out.str().find("1\tTitle 1\t1\t[Welcome, PERSON]\n") != std::string::npos);
      }
    }
  }

  GIVEN("Some processed requests") {
    auto stats = replacer::output::stats{};
    stats.process(2);
    stats.process(0);

    THEN("requests and replacements are counted") {
      REQUIRE(stats.requests == 2);
      REQUIRE(stats.replacements == 2);
    }
  }
}
