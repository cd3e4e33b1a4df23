#include "replacer/scope.h"

#include "replacer/errors.h"

#include <fmt/format.h>

namespace replacer::scope {

  namespace {
    template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    auto slide_at(deck& deck, long long index) -> slide& {
      if (index < 1 or static_cast<unsigned long long>(index) > deck.slide_count())
        throw slide_index_out_of_range_error{ index, deck.slide_count() };

      return deck.slides[static_cast<std::size_t>(index - 1)];
    }

    auto current_slide_of(deck& deck) -> slide& {
      if (not deck.cursor)
        throw no_current_slide_error{};

      return slide_at(deck, static_cast<long long>(*deck.cursor));
    }

    auto all_paragraphs_of(deck& deck) -> std::vector<paragraph*> {
      auto paragraphs = std::vector<paragraph*>{};

      for (auto& slide : deck.slides) {
        auto const on_slide = slide.paragraphs();
        paragraphs.insert(paragraphs.end(), on_slide.begin(), on_slide.end());
      }

      return paragraphs;
    }
  } // namespace

  auto to_string(scope::target const& target) -> std::string {
    return std::visit(overloaded{ [](current_slide) -> std::string { return "current slide"; },
                                  [](slide_number number) { return fmt::format("slide {}", number.index); },
                                  [](entire_deck) -> std::string { return "entire deck"; } },
                      target);
  }

  auto resolve(deck& deck, scope::target const& target) -> std::vector<paragraph*> {
    return std::visit(overloaded{ [&](current_slide) { return current_slide_of(deck).paragraphs(); },
                                  [&](slide_number number) { return slide_at(deck, number.index).paragraphs(); },
                                  [&](entire_deck) { return all_paragraphs_of(deck); } },
                      target);
  }
} // namespace replacer::scope
