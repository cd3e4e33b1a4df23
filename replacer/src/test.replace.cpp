#include "replacer/errors.h"
#include "replacer/replace.h"

#include "catch2/catch.hpp"
#include "test.fixtures.h"

#include <string>
#include <vector>

using fixtures::paragraph_of;
using fixtures::styled;

namespace {
  auto request_for(std::string old_value, std::string new_value) -> replacer::request {
    auto request      = replacer::request{};
    request.old_value = std::move(old_value);
    request.new_value = std::move(new_value);
    return request;
  }

  // Collects warnings instead of printing them.
  struct warning_collector {
    auto sink() -> replacer::warning_sink {
      return [this](replacer::no_match_warning const& warning) { warnings.push_back(warning); };
    }

    std::vector<replacer::no_match_warning> warnings;
  };
} // namespace

SCENARIO("replacing text in a paragraph list", "[replace]") {
  GIVEN("A paragraph with words starting with a lowercase n") {
    auto paragraph  = paragraph_of({ styled("no need to panic", "plain") });
    auto paragraphs = std::vector<replacer::paragraph*>{ &paragraph };

    WHEN("each such word is replaced") {
      auto const count = replacer::replace_in_scope(paragraphs, replacer::regex::compile("\\bn.*?\\b"), "example");

      THEN("only whole words are replaced") {
        REQUIRE(count == 2);
        REQUIRE(paragraph.text() == "example example to panic");
      }
    }

    AND_GIVEN("the same text chunked differently") {
      auto chunked = paragraph_of({ styled("no ne", "a"), styled("ed to pa", "b"), styled("nic", "c") });
      paragraphs.push_back(&chunked);

      WHEN("each such word is replaced") {
        auto const count = replacer::replace_in_scope(paragraphs, replacer::regex::compile("\\bn.*?\\b"), "example");

        THEN("both paragraphs read the same") {
          REQUIRE(count == 4);
          REQUIRE(chunked.text() == paragraph.text());
        }

        THEN("text outside the matches keeps its formatting") {
          REQUIRE(chunked.runs() == replacer::runs{ styled("example", "a"), styled(" ", "a"), styled("example", "a"),
                                                    styled(" to pa", "b"), styled("nic", "c") });
        }
      }
    }
  }

  GIVEN("A pattern with a capture group") {
    auto paragraph  = paragraph_of({ styled("hello PERSON", "plain") });
    auto paragraphs = std::vector<replacer::paragraph*>{ &paragraph };

    WHEN("the replacement refers to the capture") {
      replacer::replace_in_scope(paragraphs, replacer::regex::compile("(PER)SON"), "\\1-$1-\\0");

      THEN("the replacement is inserted verbatim") {
        REQUIRE(paragraph.text() == "hello \\1-$1-\\0");
      }
    }
  }

  GIVEN("A pattern which matches nothing") {
    auto paragraph  = paragraph_of({ styled("hello ", "bold"), styled("world", "italic") });
    auto paragraphs = std::vector<replacer::paragraph*>{ &paragraph };

    THEN("the paragraph is unchanged") {
      REQUIRE(replacer::replace_in_scope(paragraphs, replacer::regex::compile("PERSON"), "Alice") == 0);
      REQUIRE(paragraph.runs() == replacer::runs{ styled("hello ", "bold"), styled("world", "italic") });
    }
  }
}

SCENARIO("replacing text on slides", "[replace]") {
  GIVEN("A deck with two slides whose second slide is current") {
    auto deck      = fixtures::greeting_deck();
    auto collector = warning_collector{};

    WHEN("a placeholder is replaced as literal text") {
      auto request            = request_for("PERSON", "Alice");
      request.options.literal = true;

      auto const count = replacer::replace_text_on_slide(deck, request, collector.sink());

      THEN("it is replaced on the current slide only") {
        REQUIRE(count == 2);
        REQUIRE(fixtures::texts_of(deck.slides[1]) ==
                std::vector<std::string>{ "Hello, Alice ", "hello Alice. ", "hello person. ", "No need to panic. " });
        REQUIRE(fixtures::texts_of(deck.slides[0]) == std::vector<std::string>{ "Welcome, PERSON" });
      }

      THEN("the replacement keeps the formatting of its run") {
        auto const& runs = deck.slides[1].shapes()[1].paragraphs[0].runs();

        REQUIRE(runs == replacer::runs{ styled("hello ", "bold pink"), styled("Alice", "bold pink"),
                                        styled(". ", "bold pink") });
      }

      THEN("no warning is raised") {
        REQUIRE(collector.warnings.empty());
      }
    }

    WHEN("a placeholder is replaced on the entire deck ignoring case") {
      auto request                = request_for("PERSON", "Bob");
      request.target              = replacer::scope::entire_deck{};
      request.options.ignore_case = true;

      auto const count = replacer::replace_text_on_slide(deck, request, collector.sink());

      THEN("every spelling on every slide is replaced") {
        REQUIRE(count == 4);
        REQUIRE(fixtures::texts_of(deck.slides[0]) == std::vector<std::string>{ "Welcome, Bob" });
        REQUIRE(deck.slides[1].shapes()[1].paragraphs[1].runs() ==
                replacer::runs{ styled("hello ", "bold"), styled("Bob", "italic red"), styled(". ", "italic red") });
      }
    }

    WHEN("a slide beyond the deck is requested") {
      auto const before = fixtures::runs_of(deck);

      auto request   = request_for("PERSON", "Alice");
      request.target = replacer::scope::slide_number{ 5 };

      THEN("the request fails and the deck is unchanged") {
        REQUIRE_THROWS_AS(replacer::replace_text_on_slide(deck, request, collector.sink()),
                          replacer::slide_index_out_of_range_error);
        REQUIRE(fixtures::runs_of(deck) == before);
      }
    }

    WHEN("an invalid pattern is requested") {
      auto const before = fixtures::runs_of(deck);

      auto request   = request_for("PERSON(", "Alice");
      request.target = replacer::scope::entire_deck{};

      THEN("the request fails and the deck is unchanged") {
        REQUIRE_THROWS_AS(replacer::replace_text_on_slide(deck, request, collector.sink()), replacer::pattern_error);
        REQUIRE(fixtures::runs_of(deck) == before);
      }
    }

    WHEN("the deck has no current slide") {
      deck.cursor.reset();

      THEN("a request without slide index fails") {
        REQUIRE_THROWS_AS(replacer::replace_text_on_slide(deck, request_for("PERSON", "Alice"), collector.sink()),
                          replacer::no_current_slide_error);
      }
    }

    WHEN("nothing matches") {
      auto const before = fixtures::runs_of(deck);

      auto const count = replacer::replace_text_on_slide(deck, request_for("Carol", "Dave"), collector.sink());

      THEN("the call succeeds without changes") {
        REQUIRE(count == 0);
        REQUIRE(fixtures::runs_of(deck) == before);
      }

      THEN("a warning names the missing value") {
        REQUIRE(collector.warnings.size() == 1);
        REQUIRE(collector.warnings.front().old_value == "Carol");
        REQUIRE(std::holds_alternative<replacer::scope::current_slide>(collector.warnings.front().target));
      }
    }

    WHEN("nothing matches and warnings are turned off") {
      auto request = request_for("Carol", "Dave");
      request.warn = false;

      replacer::replace_text_on_slide(deck, request, collector.sink());

      THEN("no warning is raised") {
        REQUIRE(collector.warnings.empty());
      }
    }

    WHEN("several requests are applied") {
      auto first                = request_for("PERSON", "Alice");
      first.options.ignore_case = true;

      auto second   = request_for("panic", "worry");
      second.target = replacer::scope::slide_number{ 2 };

      auto third   = request_for("PERSON", "Bob");
      third.target = replacer::scope::slide_number{ 1 };

      auto const counts = replacer::replace_all(deck, { first, second, third }, collector.sink());

      THEN("each request is applied in order") {
        REQUIRE(counts == std::vector<std::size_t>{ 3, 1, 1 });
        REQUIRE(fixtures::texts_of(deck.slides[0]) == std::vector<std::string>{ "Welcome, Bob" });
        REQUIRE(fixtures::texts_of(deck.slides[1]).back() == "No need to worry. ");
      }
    }
  }
}
