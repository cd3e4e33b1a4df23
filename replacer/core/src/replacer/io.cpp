#include "replacer/io.h"

#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace replacer::io {
  auto content(std::filesystem::path const& filename) -> std::string {
    if (!std::filesystem::exists(filename))
      throw std::invalid_argument{ fmt::format("file not found: {}", filename.string()) };

    std::ostringstream content;
    content << std::ifstream{ filename }.rdbuf();
    return content.str();
  }

  void write(std::filesystem::path const& filename, std::string_view content) {
    auto out = std::ofstream{ filename };
    if (not out)
      throw std::runtime_error{ fmt::format("cannot write to {}", filename.string()) };

    out << content;
  }
} // namespace replacer::io
