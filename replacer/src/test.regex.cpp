#include "replacer/errors.h"
#include "replacer/regex.h"

#include "catch2/catch.hpp"

#include <vector>

using replacer::regex::span;

SCENARIO("regex tests", "[regex]") {
  namespace regex = replacer::regex;

  GIVEN("A pattern which matches any character") {
    auto const any_regex = regex::compile(".");

    THEN("it finds nothing in an empty text") {
      REQUIRE(any_regex.find_all("").empty());
    }

    THEN("it finds every character of a non-empty text") {
      REQUIRE(any_regex.find_all("42") == std::vector<span>{ { 0, 1 }, { 1, 2 } });
    }

    THEN("it remembers its pattern") {
      REQUIRE(any_regex.pattern() == ".");
    }
  }

  GIVEN("A regex which matches a name") {
    auto const name_pattern = regex::compile("[a-zA-Z]+");

    WHEN("it is applied to a text with three names") {
      auto const three_names = "Johann Sebastian Bach";

      THEN("it matches exactly three times, in order") {
        REQUIRE(name_pattern.find_all(three_names) == std::vector<span>{ { 0, 6 }, { 7, 16 }, { 17, 21 } });
      }

      THEN("a search can start behind the first name") {
        auto found = span{};

        REQUIRE(name_pattern.find(three_names, 6, &found));
        REQUIRE(found == span{ 7, 16 });
        REQUIRE(not name_pattern.find(three_names, 22, &found));
      }
    }

    WHEN("it is applied to a text without letters") {
      THEN("nothing is found") {
        REQUIRE(name_pattern.find_all("42 - 17").empty());
      }
    }
  }

  GIVEN("A pattern which can match the empty string") {
    auto const maybe_a = regex::compile("a*");

    THEN("empty matches advance by one character") {
      REQUIRE(maybe_a.find_all("baaac") == std::vector<span>{ { 0, 0 }, { 1, 4 }, { 4, 4 }, { 5, 5 } });
    }

    THEN("an empty text has one empty match") {
      REQUIRE(maybe_a.find_all("") == std::vector<span>{ { 0, 0 } });
    }
  }

  GIVEN("An empty pattern and a text with a two byte character") {
    auto const empty = regex::compile("");

    THEN("empty matches never split the character") {
      REQUIRE(empty.find_all("a\xC3\xA9") == std::vector<span>{ { 0, 0 }, { 1, 1 }, { 3, 3 } });
    }
  }

  GIVEN("A pattern with metacharacters") {
    auto const text = "abc a.c";

    WHEN("it is compiled as a regex") {
      THEN("the dot matches any character") {
        REQUIRE(regex::compile("a.c").find_all(text).size() == 2);
      }
    }

    WHEN("it is compiled as literal text") {
      auto options    = regex::options{};
      options.literal = true;

      THEN("only the literal text matches") {
        REQUIRE(regex::compile("a.c", options).find_all(text) == std::vector<span>{ { 4, 7 } });
      }
    }
  }

  GIVEN("A pattern which does not compile") {
    THEN("compiling it as a regex fails") {
      REQUIRE_THROWS_AS(regex::compile("(unbalanced"), replacer::pattern_error);
    }

    THEN("compiling it as literal text succeeds") {
      auto options    = regex::options{};
      options.literal = true;

      REQUIRE(regex::compile("(unbalanced", options).find_all("an (unbalanced text") == std::vector<span>{ { 3, 14 } });
    }
  }

  GIVEN("A pattern in upper case") {
    auto options = regex::options{};

    THEN("it matches case sensitive by default") {
      REQUIRE(regex::compile("PERSON", options).find_all("PERSON person Person").size() == 1);
    }

    THEN("it can ignore case") {
      options.ignore_case = true;
      REQUIRE(regex::compile("PERSON", options).find_all("PERSON person Person").size() == 3);
    }

    THEN("it can ignore case of literal text") {
      options.ignore_case = true;
      options.literal     = true;
      REQUIRE(regex::compile("PERSON.", options).find_all("person. Person!").size() == 1);
    }
  }

  GIVEN("A multiline text") {
    auto const text = "first line\nsecond line\n";

    WHEN("a line start is searched") {
      auto options = regex::options{};

      THEN("only the text start matches by default") {
        REQUIRE(regex::compile("^\\w+", options).find_all(text) == std::vector<span>{ { 0, 5 } });
      }

      THEN("each line start matches in multiline mode") {
        options.multiline = true;
        REQUIRE(regex::compile("^\\w+", options).find_all(text) == std::vector<span>{ { 0, 5 }, { 11, 17 } });
      }
    }

    WHEN("a dot is searched across the line break") {
      auto options = regex::options{};

      THEN("it does not match by default") {
        REQUIRE(regex::compile("line.second", options).find_all(text).empty());
      }

      THEN("it matches when the dot matches line breaks") {
        options.dot_nl = true;
        REQUIRE(regex::compile("line.second", options).find_all(text).size() == 1);
      }
    }
  }

  GIVEN("Alternatives of different length") {
    auto options = regex::options{};

    THEN("the first alternative wins by default") {
      REQUIRE(regex::compile("a|ab", options).find_all("ab") == std::vector<span>{ { 0, 1 } });
    }

    THEN("the longest alternative wins in longest match mode") {
      options.longest_match = true;
      REQUIRE(regex::compile("a|ab", options).find_all("ab") == std::vector<span>{ { 0, 2 } });
    }
  }
}
