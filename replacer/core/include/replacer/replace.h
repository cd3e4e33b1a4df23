#pragma once
#include "replacer/deck.h"
#include "replacer/regex.h"
#include "replacer/scope.h"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace replacer {

  struct request {
    std::string    old_value;
    std::string    new_value;
    scope::target  target{ scope::current_slide{} };
    bool           warn{ true };
    regex::options options;
  };

  // Raised through a warning_sink when a request replaced nothing.
  struct no_match_warning {
    std::string   old_value;
    scope::target target;
  };

  using warning_sink = std::function<void(no_match_warning const&)>;

  void log_warning(no_match_warning const& warning);

  // new_value is inserted verbatim, capture references are not expanded.
  auto replace_in_scope(std::vector<paragraph*> const& paragraphs, regex::precompiled const& pattern,
                        std::string_view new_value) -> std::size_t;

  auto replace_text_on_slide(deck& deck, request const& request, warning_sink const& warn = log_warning)
  -> std::size_t;

  auto replace_all(deck& deck, std::vector<request> const& requests, warning_sink const& warn = log_warning)
  -> std::vector<std::size_t>;
} // namespace replacer
