#include "replacer/rewrite.h"

#include <algorithm>
#include <cassert>
#include <iterator>

namespace replacer::rewrite {

  namespace {
    struct boundaries {
      text::location first;
      text::location last;
    };

    auto boundaries_of(regex::span const& span, text::offset_map const& map) -> std::optional<boundaries> {
      if (span.empty()) {
        auto const insertion = map.start_of(span.begin);
        if (not insertion)
          return std::nullopt;

        return boundaries{ *insertion, *insertion };
      }

      return boundaries{ map[span.begin], map.end_of(span.end) };
    }

    void append_non_empty(replacer::runs& runs, std::string text, replacer::formatting const& format) {
      if (not text.empty())
        runs.push_back(run{ std::move(text), format });
    }

    void replace(replacer::runs& runs, boundaries const& touched, std::string const& replacement) {
      auto const& first = runs[touched.first.run];
      auto const& last  = runs[touched.last.run];

      auto fragments = replacer::runs{};
      append_non_empty(fragments, first.text.substr(0, touched.first.offset), first.format);
      append_non_empty(fragments, replacement, first.format);
      append_non_empty(fragments, last.text.substr(touched.last.offset), last.format);

      auto const erased_begin = runs.begin() + static_cast<std::ptrdiff_t>(touched.first.run);
      auto const erased_end   = runs.begin() + static_cast<std::ptrdiff_t>(touched.last.run) + 1;

      auto const position = runs.erase(erased_begin, erased_end);
      runs.insert(position, std::make_move_iterator(fragments.begin()), std::make_move_iterator(fragments.end()));
    }
  } // namespace

  auto rewrite(replacer::runs runs, text::offset_map const& map, edits edits) -> replacer::runs {
    assert(map.run_count() == runs.size());

    if (edits.empty())
      return runs;

    std::sort(begin(edits), end(edits), [](auto const& lhs, auto const& rhs) {
      if (lhs.span.begin != rhs.span.begin)
        return lhs.span.begin > rhs.span.begin;

      return lhs.span.end > rhs.span.end;
    });

    auto const had_runs       = not runs.empty();
    auto       leftmost_format = replacer::formatting{};

    for (auto const& edit : edits) {
      auto const touched = boundaries_of(edit.span, map);

      if (not touched) {
        // nothing to split in a paragraph without runs
        if (not edit.replacement.empty())
          runs.insert(runs.begin(), run{ edit.replacement, {} });
        continue;
      }

      leftmost_format = runs[touched->first.run].format;
      replace(runs, *touched, edit.replacement);
    }

    if (had_runs and runs.empty())
      runs.push_back(run{ {}, leftmost_format });

    return runs;
  }

  auto apply(paragraph& paragraph, edits const& edits) -> std::size_t {
    if (edits.empty())
      return 0;

    auto const map = text::offset_map{ paragraph.runs() };
    paragraph.set_runs(rewrite(paragraph.runs(), map, edits));

    return edits.size();
  }
} // namespace replacer::rewrite
