#include "replacer/errors.h"
#include "replacer/json.h"

#include "catch2/catch.hpp"
#include "test.fixtures.h"

using fixtures::styled;

SCENARIO("reading and writing decks", "[json]") {
  GIVEN("A deck in JSON") {
    auto const text = R"({
      "cursor": 1,
      "slides": [
        { "shapes": [
          { "name": "Title 1",
            "paragraphs": [
              [ { "text": "hello ", "format": { "style": "bold" } },
                { "text": "PERSON", "format": { "style": "pink" } },
                { "text": ". " } ] ] },
          { "name": "Picture 2" } ] },
        { } ] })";

    WHEN("it is parsed") {
      auto const deck = replacer::json::parse_deck(text);

      THEN("slides, shapes, paragraphs and runs are read in order") {
        REQUIRE(deck.slide_count() == 2);
        REQUIRE(deck.cursor == std::size_t{ 1 });
        REQUIRE(deck.slides[0].shapes().size() == 2);
        REQUIRE(deck.slides[0].shapes()[0].name == "Title 1");
        REQUIRE(deck.slides[0].shapes()[0].paragraphs[0].runs() ==
                replacer::runs{ styled("hello ", "bold"), styled("PERSON", "pink"), replacer::run{ ". ", {} } });
      }

      THEN("shapes without text and slides without shapes have no paragraphs") {
        REQUIRE(deck.slides[0].shapes()[1].paragraphs.empty());
        REQUIRE(deck.slides[1].paragraphs().empty());
      }

      AND_WHEN("it is written and read again") {
        auto const reread = replacer::json::parse_deck(replacer::json::to_string(deck));

        THEN("nothing is lost") {
          REQUIRE(fixtures::runs_of(reread) == fixtures::runs_of(deck));
          REQUIRE(reread.cursor == deck.cursor);
          REQUIRE(reread.slides[0].shapes()[1].name == "Picture 2");
        }
      }
    }
  }

  GIVEN("A deck without current slide") {
    auto const deck = replacer::json::parse_deck(R"({ "cursor": null, "slides": [] })");

    THEN("its cursor is unset") {
      REQUIRE(not deck.cursor);
    }
  }
}

SCENARIO("reading replacement requests", "[json]") {
  GIVEN("A complete request") {
    auto const request = replacer::json::parse_request(
    R"({ "old_value": "PERSON", "new_value": "Alice", "slide_index": 3, "warn": false, "fixed": true,
         "ignore_case": true })");

    THEN("all values are taken over") {
      REQUIRE(request.old_value == "PERSON");
      REQUIRE(request.new_value == "Alice");
      REQUIRE(std::get<replacer::scope::slide_number>(request.target).index == 3);
      REQUIRE(not request.warn);
      REQUIRE(request.options.literal);
      REQUIRE(request.options.ignore_case);
      REQUIRE(not request.options.multiline);
    }
  }

  GIVEN("A minimal request") {
    auto const request = replacer::json::parse_request(R"({ "old_value": "a", "new_value": "b" })");

    THEN("it searches the current slide as a regex and warns") {
      REQUIRE(std::holds_alternative<replacer::scope::current_slide>(request.target));
      REQUIRE(request.warn);
      REQUIRE(not request.options.literal);
    }
  }

  GIVEN("A request for the entire deck") {
    auto const request = replacer::json::parse_request(R"({ "old_value": "a", "new_value": "b", "all": true })");

    THEN("it targets every slide") {
      REQUIRE(std::holds_alternative<replacer::scope::entire_deck>(request.target));
    }
  }

  GIVEN("Malformed requests") {
    using replacer::invalid_argument_error;
    using replacer::json::parse_request;

    THEN("values must be single strings") {
      REQUIRE_THROWS_AS(parse_request(R"({ "old_value": ["a", "b"], "new_value": "c" })"), invalid_argument_error);
      REQUIRE_THROWS_AS(parse_request(R"({ "old_value": "a", "new_value": 42 })"), invalid_argument_error);
      REQUIRE_THROWS_AS(parse_request(R"({ "new_value": "c" })"), invalid_argument_error);
    }

    THEN("warn must be a single boolean") {
      REQUIRE_THROWS_AS(parse_request(R"({ "old_value": "a", "new_value": "b", "warn": "yes" })"),
                        invalid_argument_error);
      REQUIRE_THROWS_AS(parse_request(R"({ "old_value": "a", "new_value": "b", "warn": [true] })"),
                        invalid_argument_error);
    }

    THEN("the slide index must be an integer") {
      REQUIRE_THROWS_AS(parse_request(R"({ "old_value": "a", "new_value": "b", "slide_index": 1.5 })"),
                        invalid_argument_error);
    }

    THEN("a request must be an object") {
      REQUIRE_THROWS_AS(parse_request(R"("a")"), invalid_argument_error);
      REQUIRE_THROWS_AS(replacer::json::parse_requests(R"({ "old_value": "a", "new_value": "b" })"),
                        invalid_argument_error);
    }
  }

  GIVEN("A list of requests") {
    auto const requests = replacer::json::parse_requests(
    R"([ { "old_value": "a", "new_value": "b" }, { "old_value": "c", "new_value": "d", "slide_index": 2 } ])");

    THEN("they are read in order") {
      REQUIRE(requests.size() == 2);
      REQUIRE(requests[0].old_value == "a");
      REQUIRE(requests[1].old_value == "c");
    }
  }
}
