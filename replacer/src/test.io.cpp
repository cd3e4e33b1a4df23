#include "replacer/io.h"

#include "catch2/catch.hpp"

#include <filesystem>
#include <stdexcept>

SCENARIO("reading and writing files", "[io]") {
  auto const directory = std::filesystem::temp_directory_path();

  GIVEN("A file which does not exist") {
    auto const missing = directory / "replacer.test.io.missing.json";
    std::filesystem::remove(missing);

    THEN("reading it fails") {
      REQUIRE_THROWS_AS(replacer::io::content(missing), std::invalid_argument);
    }
  }

  GIVEN("A file which was written") {
    auto const written = directory / "replacer.test.io.json";
    replacer::io::write(written, "{ \"slides\": [] }\n");

    THEN("its content reads back") {
      REQUIRE(replacer::io::content(written) == "{ \"slides\": [] }\n");
    }

    std::filesystem::remove(written);
  }

  GIVEN("A directory which does not exist") {
    auto const unreachable = directory / "replacer.test.io.no.such.directory" / "deck.json";

    THEN("writing into it fails") {
      REQUIRE_THROWS_AS(replacer::io::write(unreachable, "{}"), std::runtime_error);
    }
  }
}
