#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace replacer {

  // Malformed request: a value of the wrong kind where a single string or flag is expected.
  class invalid_argument_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  class pattern_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
  };

  class slide_index_out_of_range_error : public std::out_of_range {
  public:
    slide_index_out_of_range_error(long long index, std::size_t slide_count);
  };

  class no_current_slide_error : public std::logic_error {
  public:
    no_current_slide_error();
  };
} // namespace replacer
