#include "replacer/replace.h"

#include "replacer/format.h"
#include "replacer/rewrite.h"
#include "replacer/text.h"

#include <iostream>

namespace replacer {

  void log_warning(no_match_warning const& warning) {
    format::print(std::cerr, "Warning: \"{}\" not found on {}\n", format::as_literal{ warning.old_value },
                  scope::to_string(warning.target));
  }

  auto replace_in_scope(std::vector<paragraph*> const& paragraphs, regex::precompiled const& pattern,
                        std::string_view new_value) -> std::size_t {
    auto replacements = std::size_t{ 0 };

    for (auto* paragraph : paragraphs) {
      auto const flat    = text::flatten(*paragraph);
      auto const matches = pattern.find_all(flat.text);

      if (matches.empty())
        continue;

      auto edits = rewrite::edits{};
      edits.reserve(matches.size());

      for (auto const& match : matches)
        edits.push_back(rewrite::edit{ match, std::string{ new_value } });

      paragraph->set_runs(rewrite::rewrite(paragraph->runs(), flat.map, std::move(edits)));
      replacements += matches.size();
    }

    return replacements;
  }

  auto replace_text_on_slide(deck& deck, request const& request, warning_sink const& warn) -> std::size_t {
    auto const pattern    = regex::compile(request.old_value, request.options);
    auto const paragraphs = scope::resolve(deck, request.target);

    auto const replacements = replace_in_scope(paragraphs, pattern, request.new_value);

    if (replacements == 0 and request.warn and warn)
      warn(no_match_warning{ request.old_value, request.target });

    return replacements;
  }

  auto replace_all(deck& deck, std::vector<request> const& requests, warning_sink const& warn)
  -> std::vector<std::size_t> {
    auto counts = std::vector<std::size_t>{};
    counts.reserve(requests.size());

    for (auto const& request : requests)
      counts.push_back(replace_text_on_slide(deck, request, warn));

    return counts;
  }
} // namespace replacer
