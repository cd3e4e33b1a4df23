#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace replacer::io {
  auto content(std::filesystem::path const& filename) -> std::string;
  void write(std::filesystem::path const& filename, std::string_view content);
} // namespace replacer::io
