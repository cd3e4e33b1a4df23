#include "replacer/cli.h"
#include "replacer/errors.h"

#include "catch2/catch.hpp"

#include <string>
#include <vector>

namespace {
  auto parse(std::vector<std::string> arguments) -> replacer::cli::parameters {
    arguments.insert(arguments.begin(), "replacer");

    auto argv = std::vector<char*>{};
    for (auto& argument : arguments)
      argv.push_back(argument.data());

    return replacer::cli::parse(static_cast<int>(argv.size()), argv.data());
  }
} // namespace

SCENARIO("parsing the command line", "[cli]") {
  GIVEN("A deck with an old and a new value") {
    auto const parameters = parse({ "deck.json", "PERSON", "Alice" });

    THEN("the values are taken as they are") {
      REQUIRE(parameters.deck_filename.string() == "deck.json");
      REQUIRE(*parameters.old_value == "PERSON");
      REQUIRE(*parameters.new_value == "Alice");
    }

    THEN("the current slide is searched with warnings and regex syntax") {
      REQUIRE(not parameters.slide_index);
      REQUIRE(not parameters.entire_deck);
      REQUIRE(parameters.warn);
      REQUIRE(not parameters.options.literal);
      REQUIRE(parameters.output_filename.empty());
    }
  }

  GIVEN("A slide index and matching options") {
    auto const parameters = parse({ "-s", "3", "-F", "-i", "-m", "--dot-nl", "--longest", "--no-warn", "-o",
                                    "out.json", "deck.json", "PERSON", "Alice" });

    THEN("every option is set") {
      REQUIRE(parameters.slide_index.value_or(0) == 3);
      REQUIRE(parameters.options.literal);
      REQUIRE(parameters.options.ignore_case);
      REQUIRE(parameters.options.multiline);
      REQUIRE(parameters.options.dot_nl);
      REQUIRE(parameters.options.longest_match);
      REQUIRE(not parameters.warn);
      REQUIRE(parameters.output_filename.string() == "out.json");
    }
  }

  GIVEN("A requests file instead of values") {
    auto const parameters = parse({ "--all", "-r", "requests.json", "deck.json" });

    THEN("no values are expected") {
      REQUIRE(parameters.requests_filename.string() == "requests.json");
      REQUIRE(parameters.entire_deck);
      REQUIRE(not parameters.old_value);
    }
  }

  GIVEN("A request for help") {
    auto const parameters = parse({ "--help" });

    THEN("no deck is needed and the usage is available") {
      REQUIRE(parameters.help);
      REQUIRE(not parameters.usage.empty());
    }
  }

  GIVEN("Arguments which cannot be combined") {
    THEN("a missing deck is rejected") {
      REQUIRE_THROWS_AS(parse({}), replacer::invalid_argument_error);
    }

    THEN("a missing new value is rejected") {
      REQUIRE_THROWS_AS(parse({ "deck.json", "PERSON" }), replacer::invalid_argument_error);
    }

    THEN("values next to a requests file are rejected") {
      REQUIRE_THROWS_AS(parse({ "-r", "requests.json", "deck.json", "PERSON", "Alice" }),
                        replacer::invalid_argument_error);
    }

    THEN("a slide index together with the entire deck is rejected") {
      REQUIRE_THROWS_AS(parse({ "-s", "2", "--all", "deck.json", "PERSON", "Alice" }),
                        replacer::invalid_argument_error);
    }

    THEN("a slide index which is not a number is rejected") {
      REQUIRE_THROWS_AS(parse({ "-s", "two", "deck.json", "PERSON", "Alice" }), replacer::invalid_argument_error);
    }
  }
}
