#include "replacer/text.h"

#include "catch2/catch.hpp"
#include "test.fixtures.h"

using fixtures::paragraph_of;
using fixtures::styled;
using replacer::text::location;

SCENARIO("flattening of chunked paragraphs", "[text]") {
  GIVEN("A paragraph chunked into three runs") {
    auto const paragraph =
    paragraph_of({ styled("hello ", "bold"), styled("PERSON", "italic"), styled(". ", "plain") });

    WHEN("it is flattened") {
      auto const flat = replacer::text::flatten(paragraph);

      THEN("the text is the concatenation of all runs") {
        REQUIRE(flat.text == "hello PERSON. ");
        REQUIRE(flat.text == paragraph.text());
        REQUIRE(flat.map.length() == flat.text.length());
      }

      THEN("each offset maps back into its run") {
        REQUIRE(flat.map[0] == location{ 0, 0 });
        REQUIRE(flat.map[5] == location{ 0, 5 });
        REQUIRE(flat.map[6] == location{ 1, 0 });
        REQUIRE(flat.map[11] == location{ 1, 5 });
        REQUIRE(flat.map[13] == location{ 2, 1 });
      }

      THEN("every mapped offset addresses the same character") {
        for (auto offset = std::size_t{ 0 }; offset < flat.text.length(); ++offset) {
          auto const at = flat.map[offset];
          REQUIRE(paragraph.runs()[at.run].text[at.offset] == flat.text[offset]);
        }
      }

      THEN("a span end maps behind the last character it covers") {
        REQUIRE(flat.map.end_of(6) == location{ 0, 6 });
        REQUIRE(flat.map.end_of(12) == location{ 1, 6 });
        REQUIRE(flat.map.end_of(14) == location{ 2, 2 });
      }

      THEN("an insertion at the end of the text lands in the last run") {
        REQUIRE(flat.map.start_of(14) == location{ 2, 2 });
      }

      THEN("the paragraph is not touched") {
        REQUIRE(paragraph.runs().size() == 3);
        REQUIRE(paragraph.runs()[1].text == "PERSON");
      }
    }
  }

  GIVEN("A paragraph with empty runs") {
    auto const paragraph =
    paragraph_of({ styled("", "a"), styled("ab", "b"), styled("", "c"), styled("cd", "d"), styled("", "e") });

    WHEN("it is flattened") {
      auto const flat = replacer::text::flatten(paragraph);

      THEN("empty runs contribute no text") {
        REQUIRE(flat.text == "abcd");
        REQUIRE(flat.map.run_count() == 5);
      }

      THEN("offsets skip the empty runs") {
        REQUIRE(flat.map[0] == location{ 1, 0 });
        REQUIRE(flat.map[2] == location{ 3, 0 });
      }

      THEN("an insertion at the end lands in the last non-empty run") {
        REQUIRE(flat.map.start_of(4) == location{ 3, 2 });
      }
    }
  }

  GIVEN("A paragraph with only empty runs") {
    auto const paragraph = paragraph_of({ styled("", "a"), styled("", "b") });

    THEN("insertions land in the first run") {
      auto const flat = replacer::text::flatten(paragraph);

      REQUIRE(flat.text.empty());
      REQUIRE(flat.map.start_of(0) == location{ 0, 0 });
    }
  }

  GIVEN("A paragraph without runs") {
    auto const paragraph = replacer::paragraph{};

    THEN("there is no place for insertions") {
      auto const flat = replacer::text::flatten(paragraph);

      REQUIRE(flat.text.empty());
      REQUIRE(not flat.map.start_of(0));
    }
  }
}
