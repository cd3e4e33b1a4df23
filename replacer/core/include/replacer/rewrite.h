#pragma once
#include "replacer/deck.h"
#include "replacer/regex.h"
#include "replacer/text.h"

#include <string>
#include <vector>

namespace replacer::rewrite {

  struct edit {
    regex::span span;
    std::string replacement;
  };

  using edits = std::vector<edit>;

  // Replaces every span of the flattened text by its replacement. Spans must not
  // overlap; map must describe runs. Text outside the spans keeps the formatting
  // of its run, each replacement takes the formatting of the run its span starts in.
  auto rewrite(replacer::runs runs, text::offset_map const& map, edits edits) -> replacer::runs;

  // Rewrites the runs of paragraph and returns the number of applied edits.
  auto apply(paragraph& paragraph, edits const& edits) -> std::size_t;
} // namespace replacer::rewrite
