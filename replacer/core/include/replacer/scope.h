#pragma once
#include "replacer/deck.h"

#include <string>
#include <variant>
#include <vector>

namespace replacer::scope {

  struct current_slide {};
  struct slide_number {
    long long index{ 1 };
  };
  struct entire_deck {};

  using target = std::variant<current_slide, slide_number, entire_deck>;

  auto to_string(scope::target const& target) -> std::string;

  // Paragraphs of the target in slide, shape, paragraph order. Throws
  // no_current_slide_error or slide_index_out_of_range_error before anything is
  // returned.
  auto resolve(deck& deck, scope::target const& target) -> std::vector<paragraph*>;
} // namespace replacer::scope
