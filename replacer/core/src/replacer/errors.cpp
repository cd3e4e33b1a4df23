#include "replacer/errors.h"

#include <fmt/format.h>

namespace replacer {

  slide_index_out_of_range_error::slide_index_out_of_range_error(long long index, std::size_t slide_count)
  : std::out_of_range{ fmt::format("Slide index {} out of range: the deck has {} slide(s)", index, slide_count) } {
  }

  no_current_slide_error::no_current_slide_error() : std::logic_error{ "The deck has no current slide" } {
  }
} // namespace replacer
