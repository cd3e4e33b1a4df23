#include "replacer/cli.h"
#include "replacer/format.h"
#include "replacer/io.h"
#include "replacer/json.h"
#include "replacer/output.h"
#include "replacer/replace.h"

#include <chrono>
#include <future>
#include <iostream>

namespace replacer {

  auto parse_deck_async(std::filesystem::path const& filename) {
    return std::async(std::launch::async, [=] { return json::parse_deck(io::content(filename)); });
  }

  auto parse_requests_async(cli::parameters const& parameters) {
    return std::async(std::launch::async, [=] {
      if (not parameters.requests_filename.empty())
        return json::parse_requests(io::content(parameters.requests_filename));

      auto single = request{};
      single.old_value = *parameters.old_value;
      single.new_value = *parameters.new_value;
      single.warn      = parameters.warn;
      single.options   = parameters.options;

      if (parameters.entire_deck)
        single.target = scope::entire_deck{};
      else if (parameters.slide_index)
        single.target = scope::slide_number{ *parameters.slide_index };

      return std::vector<request>{ single };
    });
  }
} // namespace replacer

int main(int argc, char* argv[]) {
  using namespace replacer;

  auto       stats = output::stats{};
  auto const start = std::chrono::steady_clock::now();

  try {
    auto const parameters = cli::parse(argc, argv);

    if (parameters.help) {
      std::cout << parameters.usage << '\n';
      return 0;
    }

    auto requests = parse_requests_async(parameters);
    auto deck     = parse_deck_async(parameters.deck_filename).get();

    if (parameters.summary)
      output::print(std::cerr, deck);

    for (auto const count : replace_all(deck, requests.get()))
      stats.process(count);

    if (parameters.summary)
      output::print(std::cerr, deck);

    if (parameters.output_filename.empty())
      std::cout << json::to_string(deck) << '\n';
    else
      io::write(parameters.output_filename, json::to_string(deck));
  }
  catch (std::exception const& e) {
    std::cerr << e.what() << '\n';
    return 1;
  }

  auto const elapsed = std::chrono::steady_clock::now() - start;

  format::print(std::cerr, "Replaced {} occurrence(s) for {} request(s) in {} millisecond(s).\n", stats.replacements,
                stats.requests, std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

  return 0;
}
