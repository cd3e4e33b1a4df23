#include "replacer/text.h"

#include <cassert>

namespace replacer::text {

  offset_map::offset_map(replacer::runs const& runs) : run_count_(runs.size()) {
    for (auto index = std::size_t{ 0 }; index < runs.size(); ++index) {
      auto const run_length = runs[index].text.length();

      owners.assign(length_, length_ + run_length, index);
      length_ += run_length;
    }
  }

  auto offset_map::operator[](std::size_t offset) const -> location {
    assert(offset < length_);

    return { owners[offset], offset - owners.lower_key(offset) };
  }

  auto offset_map::start_of(std::size_t offset) const -> std::optional<location> {
    if (offset < length_)
      return (*this)[offset];

    if (length_ > 0)
      return end_of(length_);

    if (run_count_ > 0)
      return location{ 0, 0 };

    return std::nullopt;
  }

  auto offset_map::end_of(std::size_t offset) const -> location {
    assert(offset > 0 and offset <= length_);

    auto last = (*this)[offset - 1];
    ++last.offset;
    return last;
  }

  auto flatten(paragraph const& paragraph) -> flattened {
    auto const& runs = paragraph.runs();

    auto result = flattened{ {}, offset_map{ runs } };
    result.text.reserve(result.map.length());

    for (auto const& run : runs)
      result.text.append(run.text);

    return result;
  }
} // namespace replacer::text
