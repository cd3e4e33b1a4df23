#pragma once
#include "replacer/deck.h"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace replacer::output {

  // One paragraph of a deck, as listed by a slide summary.
  struct row {
    std::size_t slide;
    std::string shape;
    std::size_t paragraph;
    std::size_t runs;
    std::string text;
  };

  auto summarize(deck const& deck) -> std::vector<row>;

  // Tab separated summary table with one line per paragraph, runs shown in brackets.
  void print(std::ostream& out, deck const& deck);

  struct stats {
    void process(std::size_t replacements) {
      ++requests;
      this->replacements += replacements;
    }

    std::size_t requests{ 0 };
    std::size_t replacements{ 0 };
  };
} // namespace replacer::output
