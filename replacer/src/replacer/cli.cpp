#include "replacer/cli.h"

#include "replacer/errors.h"
#include "replacer/macros.h"

REPLACER_WARNINGS_PUSH

REPLACER_MSC_WARNING(disable : 4100)
REPLACER_MSC_WARNING(disable : 4458)
REPLACER_GCC_DIAGNOSTIC(ignored "-Wtype-limits")

#include <lyra/lyra.hpp>

REPLACER_WARNINGS_POP

#include <sstream>

auto replacer::cli::parse(int argc, char* argv[]) -> replacer::cli::parameters {
  replacer::cli::parameters p;

  auto const cli =
  lyra::help(p.help) |
  lyra::opt([&](long long index) { p.slide_index = index; }, "slide index")["-s"]["--slide"](
  "1-based slide to search (default: the current slide of the deck)") |
  lyra::opt(p.entire_deck)["-a"]["--all"]("Search every slide of the deck") |
  lyra::opt(p.options.literal)["-F"]["--fixed"]("Match old value as plain text") |
  lyra::opt(p.options.ignore_case)["-i"]["--ignore-case"]("Ignore case when matching") |
  lyra::opt(p.options.multiline)["-m"]["--multiline"]("^ and $ match at line breaks") |
  lyra::opt(p.options.dot_nl)["--dot-nl"](". matches line breaks") |
  lyra::opt(p.options.longest_match)["--longest"]("Prefer leftmost-longest matches") |
  lyra::opt([&](bool) { p.warn = false; })["--no-warn"]("Do not warn when nothing was replaced") |
  lyra::opt(p.summary)["--summary"]("Print a slide summary before and after replacing") |
  lyra::opt(p.requests_filename, "requests filename")["-r"]["--requests"]("JSON file with replacement requests") |
  lyra::opt(p.output_filename, "output filename")["-o"]["--output"]("Write the deck to this file instead of stdout") |
  lyra::arg(p.deck_filename, "deck filename")("JSON file with the deck") |
  lyra::arg([&](std::string const& value) { p.old_value = value; }, "old value")("Pattern to search for") |
  lyra::arg([&](std::string const& value) { p.new_value = value; }, "new value")("Replacement text");

  if (auto const result = cli.parse({ argc, argv }); not result)
    throw invalid_argument_error{ result.errorMessage() };

  std::ostringstream usage;
  usage << cli;
  p.usage = usage.str();

  if (p.help)
    return p;

  if (p.deck_filename.empty())
    throw invalid_argument_error{ "expected a deck file" };

  if (p.requests_filename.empty() and (not p.old_value or not p.new_value))
    throw invalid_argument_error{ "expected an old and a new value, or a requests file" };

  if (not p.requests_filename.empty() and (p.old_value or p.new_value))
    throw invalid_argument_error{ "old and new value cannot be combined with a requests file" };

  if (p.entire_deck and p.slide_index)
    throw invalid_argument_error{ "--slide and --all are mutually exclusive" };

  return p;
}
