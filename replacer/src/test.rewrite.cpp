#include "replacer/regex.h"
#include "replacer/rewrite.h"

#include "catch2/catch.hpp"
#include "test.fixtures.h"

#include <string>
#include <vector>

using fixtures::paragraph_of;
using fixtures::styled;

namespace {
  // One run per character, styled by its position.
  auto one_run_per_character(std::string const& text) -> replacer::paragraph {
    auto runs = replacer::runs{};
    for (auto index = std::size_t{ 0 }; index < text.length(); ++index)
      runs.push_back(styled(text.substr(index, 1), std::to_string(index)));

    return replacer::paragraph{ std::move(runs) };
  }

  auto edits_for(replacer::paragraph const& paragraph, std::string const& pattern, std::string const& replacement)
  -> replacer::rewrite::edits {
    auto edits = replacer::rewrite::edits{};

    for (auto const& span : replacer::regex::compile(pattern).find_all(paragraph.text()))
      edits.push_back({ span, replacement });

    return edits;
  }
} // namespace

SCENARIO("rewriting chunked runs", "[rewrite]") {
  GIVEN("A placeholder which is a run of its own") {
    auto paragraph = paragraph_of({ styled("hello ", "bold"), styled("PERSON", "pink"), styled(". ", "plain") });

    WHEN("the placeholder is replaced") {
      auto const applied = replacer::rewrite::apply(paragraph, { { { 6, 12 }, "Alice" } });

      THEN("only its run is replaced, keeping the formatting") {
        REQUIRE(applied == 1);
        REQUIRE(paragraph.text() == "hello Alice. ");
        REQUIRE(paragraph.runs() ==
                replacer::runs{ styled("hello ", "bold"), styled("Alice", "pink"), styled(". ", "plain") });
      }
    }

    WHEN("the placeholder is deleted") {
      replacer::rewrite::apply(paragraph, { { { 6, 12 }, "" } });

      THEN("no run is inserted") {
        REQUIRE(paragraph.runs() == replacer::runs{ styled("hello ", "bold"), styled(". ", "plain") });
      }
    }

    WHEN("nothing is applied") {
      auto const applied = replacer::rewrite::apply(paragraph, {});

      THEN("the runs are unchanged") {
        REQUIRE(applied == 0);
        REQUIRE(paragraph.runs() ==
                replacer::runs{ styled("hello ", "bold"), styled("PERSON", "pink"), styled(". ", "plain") });
      }
    }
  }

  GIVEN("A match inside a single run") {
    auto paragraph = paragraph_of({ styled("say hello world", "plain") });

    WHEN("it is replaced") {
      replacer::rewrite::apply(paragraph, { { { 4, 9 }, "bye" } });

      THEN("the run is split around the replacement") {
        REQUIRE(paragraph.runs() ==
                replacer::runs{ styled("say ", "plain"), styled("bye", "plain"), styled(" world", "plain") });
      }
    }
  }

  GIVEN("A match across three runs") {
    auto paragraph = paragraph_of({ styled("ab", "first"), styled("cd", "middle"), styled("ef", "last") });

    WHEN("it is replaced") {
      replacer::rewrite::apply(paragraph, { { { 1, 5 }, "X" } });

      THEN("the outer fragments keep their formatting and the middle run is gone") {
        REQUIRE(paragraph.runs() == replacer::runs{ styled("a", "first"), styled("X", "first"), styled("f", "last") });
      }
    }
  }

  GIVEN("A match across an empty run") {
    auto paragraph = paragraph_of({ styled("ab", "first"), styled("", "empty"), styled("cd", "last") });

    WHEN("it is replaced") {
      replacer::rewrite::apply(paragraph, { { { 1, 3 }, "X" } });

      THEN("the empty run inside the match is deleted") {
        REQUIRE(paragraph.runs() == replacer::runs{ styled("a", "first"), styled("X", "first"), styled("d", "last") });
      }
    }
  }

  GIVEN("Empty runs outside of a match") {
    auto paragraph =
    paragraph_of({ styled("", "a"), styled("ab", "b"), styled("", "c"), styled("cd", "d"), styled("", "e") });

    WHEN("a character is replaced") {
      replacer::rewrite::apply(paragraph, { { { 1, 2 }, "B" } });

      THEN("the empty runs stay in place") {
        REQUIRE(paragraph.runs() == replacer::runs{ styled("", "a"), styled("a", "b"), styled("B", "b"),
                                                    styled("", "c"), styled("cd", "d"), styled("", "e") });
      }
    }
  }

  GIVEN("Several matches in one run") {
    auto paragraph = paragraph_of({ styled("aXbXc", "plain") });

    WHEN("all of them are replaced") {
      replacer::rewrite::apply(paragraph, { { { 1, 2 }, "1" }, { { 3, 4 }, "2" } });

      THEN("each replacement lands at its own position") {
        REQUIRE(paragraph.text() == "a1b2c");
        REQUIRE(paragraph.runs().size() == 5);
      }
    }

    WHEN("they are given in any order") {
      replacer::rewrite::apply(paragraph, { { { 3, 4 }, "2" }, { { 1, 2 }, "1" } });

      THEN("the result is the same") {
        REQUIRE(paragraph.text() == "a1b2c");
      }
    }
  }

  GIVEN("A paragraph with one run per character") {
    auto paragraph = one_run_per_character("abcabc");

    WHEN("a two character word is replaced everywhere") {
      replacer::rewrite::apply(paragraph, edits_for(paragraph, "bc", "X"));

      THEN("each replacement takes the formatting of the run it starts in") {
        REQUIRE(paragraph.runs() ==
                replacer::runs{ styled("a", "0"), styled("X", "1"), styled("a", "3"), styled("X", "4") });
      }
    }
  }

  GIVEN("A match covering the whole paragraph") {
    auto paragraph = paragraph_of({ styled("abc", "plain") });

    WHEN("it is deleted") {
      replacer::rewrite::apply(paragraph, { { { 0, 3 }, "" } });

      THEN("an empty run keeps the formatting") {
        REQUIRE(paragraph.runs() == replacer::runs{ styled("", "plain") });
      }
    }
  }

  GIVEN("Empty matches") {
    auto paragraph = paragraph_of({ styled("ba", "first"), styled("aac", "second") });

    WHEN("they are replaced together with non-empty ones") {
      replacer::rewrite::apply(paragraph, edits_for(paragraph, "a*", "-"));

      THEN("the text matches a global replacement") {
        REQUIRE(paragraph.text() == "-b--c-");
      }

      THEN("insertions at the start and at the end take the formatting of the neighbouring runs") {
        REQUIRE(paragraph.runs().front() == styled("-", "first"));
        REQUIRE(paragraph.runs().back() == styled("-", "second"));
      }
    }

    WHEN("one lands on a run boundary") {
      replacer::rewrite::apply(paragraph, { { { 2, 2 }, "|" } });

      THEN("it is inserted before the following run with its formatting") {
        REQUIRE(paragraph.runs() ==
                replacer::runs{ styled("ba", "first"), styled("|", "second"), styled("aac", "second") });
      }
    }
  }

  GIVEN("A paragraph with only an empty run") {
    auto paragraph = paragraph_of({ styled("", "plain") });

    WHEN("text is inserted") {
      replacer::rewrite::apply(paragraph, { { { 0, 0 }, "new" } });

      THEN("the insertion takes the formatting of the empty run") {
        REQUIRE(paragraph.runs() == replacer::runs{ styled("new", "plain") });
      }
    }
  }

  GIVEN("A paragraph without runs") {
    auto paragraph = replacer::paragraph{};

    WHEN("text is inserted") {
      replacer::rewrite::apply(paragraph, { { { 0, 0 }, "new" } });

      THEN("a run without formatting is created") {
        REQUIRE(paragraph.runs() == replacer::runs{ replacer::run{ "new", {} } });
      }
    }
  }
}

SCENARIO("rewriting does not depend on chunking", "[rewrite]") {
  GIVEN("The same text chunked in different ways") {
    auto const text = std::string{ "the quick brown fox jumps" };

    auto const partitions = std::vector<replacer::paragraph>{
      paragraph_of({ styled(text, "whole") }),
      one_run_per_character(text),
      paragraph_of({ styled("the qu", "a"), styled("ick br", "b"), styled("own f", "c"), styled("ox jumps", "d") }),
      paragraph_of({ styled("", "a"), styled("the quick bro", "b"), styled("", "c"), styled("wn fox jumps", "d") }),
    };

    WHEN("the same pattern is replaced in each of them") {
      auto const pattern = replacer::regex::compile("o\\w");

      THEN("the matches and the resulting text are identical") {
        for (auto paragraph : partitions) {
          auto const matches = pattern.find_all(paragraph.text());
          REQUIRE(matches == std::vector<replacer::regex::span>{ { 12, 14 }, { 17, 19 } });

          replacer::rewrite::apply(paragraph, edits_for(paragraph, "o\\w", "0"));
          REQUIRE(paragraph.text() == "the quick br0n f0 jumps");
        }
      }
    }
  }
}
