#include "replacer/errors.h"
#include "replacer/scope.h"

#include "catch2/catch.hpp"
#include "test.fixtures.h"

#include <vector>

SCENARIO("resolving the paragraphs to search", "[scope]") {
  namespace scope = replacer::scope;

  GIVEN("A deck with two slides whose second slide is current") {
    auto deck = fixtures::greeting_deck();

    WHEN("the current slide is resolved") {
      auto const paragraphs = scope::resolve(deck, scope::current_slide{});

      THEN("all paragraphs of its shapes are listed in shape order") {
        auto& shapes = deck.slides[1].shapes();

        REQUIRE(paragraphs == std::vector<replacer::paragraph*>{ &shapes[0].paragraphs[0], &shapes[1].paragraphs[0],
                                                                  &shapes[1].paragraphs[1], &shapes[1].paragraphs[2] });
      }
    }

    WHEN("the first slide is resolved by its index") {
      auto const paragraphs = scope::resolve(deck, scope::slide_number{ 1 });

      THEN("only its paragraph is listed") {
        REQUIRE(paragraphs == std::vector<replacer::paragraph*>{ &deck.slides[0].shapes()[0].paragraphs[0] });
      }
    }

    WHEN("the entire deck is resolved") {
      auto const paragraphs = scope::resolve(deck, scope::entire_deck{});

      THEN("the paragraphs of all slides are listed in slide order") {
        REQUIRE(paragraphs.size() == 5);
        REQUIRE(paragraphs.front() == &deck.slides[0].shapes()[0].paragraphs[0]);
        REQUIRE(paragraphs.back() == &deck.slides[1].shapes()[1].paragraphs[2]);
      }
    }

    WHEN("a slide index beyond the deck is resolved") {
      THEN("resolution fails") {
        REQUIRE_THROWS_AS(scope::resolve(deck, scope::slide_number{ 3 }), replacer::slide_index_out_of_range_error);
      }
    }

    WHEN("a slide index below one is resolved") {
      THEN("resolution fails") {
        REQUIRE_THROWS_AS(scope::resolve(deck, scope::slide_number{ 0 }), replacer::slide_index_out_of_range_error);
        REQUIRE_THROWS_AS(scope::resolve(deck, scope::slide_number{ -1 }), replacer::slide_index_out_of_range_error);
      }
    }

    AND_GIVEN("no current slide") {
      deck.cursor.reset();

      THEN("the current slide cannot be resolved") {
        REQUIRE_THROWS_AS(scope::resolve(deck, scope::current_slide{}), replacer::no_current_slide_error);
      }

      THEN("explicit slides can still be resolved") {
        REQUIRE(scope::resolve(deck, scope::slide_number{ 2 }).size() == 4);
      }
    }

    AND_GIVEN("a current slide which no longer exists") {
      deck.cursor = 7;

      THEN("the current slide cannot be resolved") {
        REQUIRE_THROWS_AS(scope::resolve(deck, scope::current_slide{}), replacer::slide_index_out_of_range_error);
      }
    }
  }

  GIVEN("Any target") {
    THEN("it can be described") {
      REQUIRE(scope::to_string(scope::current_slide{}) == "current slide");
      REQUIRE(scope::to_string(scope::slide_number{ 3 }) == "slide 3");
      REQUIRE(scope::to_string(scope::entire_deck{}) == "entire deck");
    }
  }
}
