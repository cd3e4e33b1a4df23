#include "replacer/regex.h"

#include "replacer/errors.h"

#include <re2/re2.h>

#include <algorithm>
#include <cassert>
#include <string>

namespace replacer::regex {

  namespace {
    auto as_string_piece(std::string_view sv) {
      return re2::StringPiece{ sv.data(), sv.length() };
    }

    auto as_re2_options(regex::options const& options) {
      auto re2_options = re2::RE2::Options{ re2::RE2::Quiet };

      re2_options.set_literal(options.literal);
      re2_options.set_case_sensitive(not options.ignore_case);
      re2_options.set_dot_nl(options.dot_nl);
      re2_options.set_longest_match(options.longest_match);
      re2_options.set_posix_syntax(options.posix_syntax);
      re2_options.set_one_line(not options.multiline);

      return re2_options;
    }

    // one_line only applies to posix syntax; perl syntax needs the inline flag
    auto effective_pattern(std::string_view pattern, regex::options const& options) {
      if (options.multiline and not options.literal and not options.posix_syntax)
        return std::string{ "(?m)" }.append(pattern);

      return std::string{ pattern };
    }

    auto code_point_length(std::string_view text, std::size_t position) -> std::size_t {
      auto const lead = static_cast<unsigned char>(text[position]);

      auto length = std::size_t{ 1 };
      if ((lead & 0xE0u) == 0xC0u)
        length = 2;
      else if ((lead & 0xF0u) == 0xE0u)
        length = 3;
      else if ((lead & 0xF8u) == 0xF0u)
        length = 4;

      return std::min(length, text.length() - position);
    }
  } // namespace

  class precompiled::impl : public re2::RE2 {
  public:
    impl(std::string_view pattern, regex::options const& options)
    : RE2(effective_pattern(pattern, options), as_re2_options(options)), source(pattern) {
    }

    std::string source;
  };

  precompiled::precompiled(std::string_view pattern, regex::options const& options)
  : engine(std::make_shared<impl>(pattern, options)) {
    if (not engine->ok())
      throw pattern_error{ std::string{ "Invalid regex: " }.append(engine->error()) };
  }

  auto precompiled::find(std::string_view input, std::size_t position, span* span_ret) const -> bool {
    assert(engine);

    if (position > input.length())
      return false;

    auto match = re2::StringPiece{};
    if (not engine->Match(as_string_piece(input), position, input.length(), re2::RE2::UNANCHORED, &match, 1))
      return false;

    if (span_ret) {
      span_ret->begin = static_cast<std::size_t>(match.data() - input.data());
      span_ret->end   = span_ret->begin + match.length();
    }

    return true;
  }

  auto precompiled::find_all(std::string_view input) const -> std::vector<span> {
    auto found    = std::vector<span>{};
    auto position = std::size_t{ 0 };
    auto current  = span{};

    while (find(input, position, &current)) {
      found.push_back(current);
      position = current.end;

      if (not current.empty())
        continue;

      if (position == input.length())
        break;

      position += code_point_length(input, position);
    }

    return found;
  }

  auto precompiled::pattern() const -> std::string_view {
    if (not engine)
      return {};

    return engine->source;
  }

  auto compile(std::string_view pattern, regex::options const& options) -> precompiled {
    return precompiled{ pattern, options };
  }
} // namespace replacer::regex
