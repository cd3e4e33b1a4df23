#pragma once
#include "replacer/deck.h"

#include <string>
#include <utility>
#include <vector>

namespace fixtures {

  inline auto style(std::string const& name) -> replacer::formatting {
    return replacer::formatting{ { { "style", name } } };
  }

  inline auto styled(std::string text, std::string const& name) -> replacer::run {
    return replacer::run{ std::move(text), style(name) };
  }

  inline auto paragraph_of(replacer::runs runs) -> replacer::paragraph {
    return replacer::paragraph{ std::move(runs) };
  }

  inline auto shape_of(std::string name, std::vector<replacer::paragraph> paragraphs) -> replacer::shape {
    return replacer::shape{ std::move(name), std::move(paragraphs) };
  }

  inline auto slide_of(std::vector<replacer::shape> shapes) -> replacer::slide {
    return replacer::slide{ std::move(shapes) };
  }

  // Run sequences of all paragraphs, slide by slide.
  inline auto runs_of(replacer::deck const& deck) -> std::vector<replacer::runs> {
    auto all = std::vector<replacer::runs>{};

    for (auto const& slide : deck.slides)
      for (auto const* paragraph : slide.paragraphs())
        all.push_back(paragraph->runs());

    return all;
  }

  inline auto texts_of(replacer::slide const& slide) -> std::vector<std::string> {
    auto texts = std::vector<std::string>{};

    for (auto const* paragraph : slide.paragraphs())
      texts.push_back(paragraph->text());

    return texts;
  }

  // Two slides greeting a person, the second one is current.
  inline auto greeting_deck() -> replacer::deck {
    auto deck = replacer::deck{};

    deck.slides.push_back(slide_of({ shape_of("Title 1", { paragraph_of({ styled("Welcome, PERSON", "title") }) }) }));

    deck.slides.push_back(slide_of({
    shape_of("Title 1", { paragraph_of({ styled("Hello, PERSON ", "title") }) }),
    shape_of("Content Placeholder 2",
             { paragraph_of({ styled("hello PERSON. ", "bold pink") }),
               paragraph_of({ styled("hello ", "bold"), styled("person. ", "italic red") }),
               paragraph_of({ styled("No need to panic. ", "plain") }) }),
    shape_of("Picture 3", {}),
    }));

    deck.cursor = 2;
    return deck;
  }
} // namespace fixtures
