#pragma once
#include "replacer/regex.h"

#include <filesystem>
#include <optional>
#include <string>

namespace replacer::cli {
  struct parameters {
    std::filesystem::path      deck_filename;
    std::filesystem::path      requests_filename;
    std::filesystem::path      output_filename;
    std::optional<std::string> old_value;
    std::optional<std::string> new_value;
    std::optional<long long>   slide_index;
    bool                       entire_deck{ false };
    bool                       warn{ true };
    bool                       summary{ false };
    bool                       help{ false };
    regex::options             options;
    std::string                usage;
  };

  auto parse(int argc, char* argv[]) -> parameters;
} // namespace replacer::cli
