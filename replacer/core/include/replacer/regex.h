#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace replacer::regex {

  // Half-open byte range [begin, end) of a match.
  struct span {
    std::size_t begin{ 0 };
    std::size_t end{ 0 };

    auto length() const noexcept -> std::size_t {
      return end - begin;
    }

    auto empty() const noexcept -> bool {
      return begin == end;
    }

    friend auto operator==(span const& lhs, span const& rhs) noexcept -> bool {
      return lhs.begin == rhs.begin and lhs.end == rhs.end;
    }

    friend auto operator!=(span const& lhs, span const& rhs) noexcept -> bool {
      return not(lhs == rhs);
    }
  };

  struct options {
    bool literal{ false };
    bool ignore_case{ false };
    bool multiline{ false };
    bool dot_nl{ false };
    bool longest_match{ false };
    bool posix_syntax{ false };
  };

  class precompiled {
  public:
    precompiled() = default;

    auto find(std::string_view input, std::size_t position, span* span_ret) const -> bool;
    auto find_all(std::string_view input) const -> std::vector<span>;

    auto pattern() const -> std::string_view;

  private:
    precompiled(std::string_view pattern, regex::options const& options);
    friend auto compile(std::string_view pattern, regex::options const& options) -> precompiled;

  private:
    class impl;
    std::shared_ptr<impl> engine;
  };

  // Throws pattern_error if the pattern does not compile.
  auto compile(std::string_view pattern, regex::options const& options = {}) -> precompiled;
} // namespace replacer::regex
