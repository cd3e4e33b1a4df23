#pragma once
#include "replacer/container.h"
#include "replacer/deck.h"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace replacer::text {

  inline constexpr auto no_run = std::numeric_limits<std::size_t>::max();

  // Position inside the run sequence of a paragraph.
  struct location {
    std::size_t run{ 0 };
    std::size_t offset{ 0 };

    friend auto operator==(location const& lhs, location const& rhs) noexcept -> bool {
      return lhs.run == rhs.run and lhs.offset == rhs.offset;
    }

    friend auto operator!=(location const& lhs, location const& rhs) noexcept -> bool {
      return not(lhs == rhs);
    }
  };

  // Maps offsets of the flattened paragraph text back to runs. An offset on a run
  // boundary belongs to the following non-empty run; empty runs own no offset.
  class offset_map {
  public:
    offset_map() = default;
    explicit offset_map(replacer::runs const& runs);

    auto length() const noexcept -> std::size_t {
      return length_;
    }

    auto run_count() const noexcept -> std::size_t {
      return run_count_;
    }

    // Requires offset < length().
    auto operator[](std::size_t offset) const -> location;

    // Where text inserted at offset lands. At the end of the text this is the end of
    // the last non-empty run; without any text it is the start of the first run.
    auto start_of(std::size_t offset) const -> std::optional<location>;

    // Location just behind the byte at offset - 1. Requires 0 < offset <= length().
    auto end_of(std::size_t offset) const -> location;

  private:
    container::interval_map<std::size_t, std::size_t> owners{ no_run };
    std::size_t                                       length_{ 0 };
    std::size_t                                       run_count_{ 0 };
  };

  struct flattened {
    std::string text;
    offset_map  map;
  };

  auto flatten(paragraph const& paragraph) -> flattened;
} // namespace replacer::text
