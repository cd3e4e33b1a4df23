#pragma once
#include "replacer/deck.h"

#include <fmt/format.h>

#include <iterator>
#include <string_view>

namespace replacer::format {

  template <class Stream, class... Args> void print(Stream&& out, std::string_view fmt, Args&&... args) {
    fmt::vformat_to(std::ostream_iterator<char>(out), fmt, fmt::make_format_args(args...));
  }

  // Text with quotes, backslashes and line breaks escaped.
  struct as_literal {
    std::string_view str;
  };

  // Run texts of a paragraph, each in brackets: [hello ][PERSON][. ]
  struct as_chunks {
    replacer::runs const& runs;
  };

} // namespace replacer::format

namespace fmt {

  template <> struct formatter<replacer::format::as_literal> {
    template <typename ParseContext> constexpr auto parse(ParseContext& ctx) {
      return ctx.begin();
    }

    template <typename FormatContext> auto format(replacer::format::as_literal const& text, FormatContext& ctx) const {
      auto out = ctx.out();

      for (auto const& ch : text.str) {
        switch (ch) {
        case '\n':
          *out++ = '\\';
          *out++ = 'n';
          break;
        case '\r':
          *out++ = '\\';
          *out++ = 'r';
          break;
        case '\t':
          *out++ = '\\';
          *out++ = 't';
          break;
        case '\\':
          [[fallthrough]];
        case '\"':
          *out++ = '\\';
          [[fallthrough]];
        default:
          *out++ = ch;
          break;
        }
      }

      return out;
    }
  };

  template <> struct formatter<replacer::format::as_chunks> {
    template <typename ParseContext> constexpr auto parse(ParseContext& ctx) {
      return ctx.begin();
    }

    template <typename FormatContext> auto format(replacer::format::as_chunks const& chunks, FormatContext& ctx) const {
      auto out = ctx.out();

      for (auto const& run : chunks.runs)
        out = fmt::format_to(out, "[{}]", replacer::format::as_literal{ run.text });

      return out;
    }
  };
} // namespace fmt
