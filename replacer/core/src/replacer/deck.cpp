#include "replacer/deck.h"

namespace replacer {

  namespace {
    template <class Paragraph, class Shapes> auto collect_paragraphs(Shapes& shapes) {
      auto collected = std::vector<Paragraph*>{};

      for (auto& shape : shapes)
        for (auto& paragraph : shape.paragraphs)
          collected.push_back(&paragraph);

      return collected;
    }
  } // namespace

  auto paragraph::text() const -> std::string {
    auto concatenated = std::string{};

    for (auto const& run : runs_)
      concatenated.append(run.text);

    return concatenated;
  }

  auto slide::paragraphs() -> std::vector<paragraph*> {
    return collect_paragraphs<paragraph>(shapes_);
  }

  auto slide::paragraphs() const -> std::vector<paragraph const*> {
    return collect_paragraphs<paragraph const>(shapes_);
  }
} // namespace replacer
