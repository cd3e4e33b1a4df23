#include "replacer/output.h"

#include "replacer/format.h"

#include <ostream>

namespace replacer::output {

  auto summarize(deck const& deck) -> std::vector<row> {
    auto rows = std::vector<row>{};

    for (auto slide = std::size_t{ 0 }; slide < deck.slides.size(); ++slide)
      for (auto const& shape : deck.slides[slide].shapes())
        for (auto paragraph = std::size_t{ 0 }; paragraph < shape.paragraphs.size(); ++paragraph) {
          auto const& current = shape.paragraphs[paragraph];
          rows.push_back(row{ slide + 1, shape.name, paragraph + 1, current.runs().size(), current.text() });
        }

    return rows;
  }

  void print(std::ostream& out, deck const& deck) {
    format::print(out, "slide\tshape\tparagraph\ttext\n");

    for (auto slide = std::size_t{ 0 }; slide < deck.slides.size(); ++slide) {
      auto const marker = (deck.cursor and *deck.cursor == slide + 1) ? "*" : "";

      for (auto const& shape : deck.slides[slide].shapes())
        for (auto paragraph = std::size_t{ 0 }; paragraph < shape.paragraphs.size(); ++paragraph)
          format::print(out, "{}{}\t{}\t{}\t{}\n", slide + 1, marker, format::as_literal{ shape.name }, paragraph + 1,
                        format::as_chunks{ shape.paragraphs[paragraph].runs() });
    }
  }
} // namespace replacer::output
