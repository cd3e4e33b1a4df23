#include "replacer/regex.h"
#include "replacer/replace.h"

#include <benchmark/benchmark.h>

#include <string>

static void BM_RegexCompilation(benchmark::State& state) {
  for (auto _ : state)
    replacer::regex::compile("\\bn.*?\\b");
}
BENCHMARK(BM_RegexCompilation);

// A paragraph with one run per word, a placeholder in every fourth word.
static auto chunked_paragraph(std::size_t words) -> replacer::paragraph {
  auto runs = replacer::runs{};

  for (auto index = std::size_t{ 0 }; index < words; ++index)
    runs.push_back(
    replacer::run{ index % 4 == 0 ? "PER" : "word ", replacer::formatting{ { { "run", std::to_string(index) } } } });

  return replacer::paragraph{ std::move(runs) };
}

static void BM_ReplaceChunkedParagraph(benchmark::State& state) {
  auto options    = replacer::regex::options{};
  options.literal = true;

  auto const pattern = replacer::regex::compile("PERword", options);
  auto const words   = static_cast<std::size_t>(state.range(0));

  for (auto _ : state) {
    state.PauseTiming();
    auto paragraph  = chunked_paragraph(words);
    auto paragraphs = std::vector<replacer::paragraph*>{ &paragraph };
    state.ResumeTiming();

    benchmark::DoNotOptimize(replacer::replace_in_scope(paragraphs, pattern, "Alice"));
  }
}
BENCHMARK(BM_ReplaceChunkedParagraph)->Range(8, 4096);
