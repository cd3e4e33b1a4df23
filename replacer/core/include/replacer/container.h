#pragma once
#include <algorithm>
#include <cassert>
#include <iterator>
#include <limits>
#include <map>

namespace replacer::container {

  // Maps half-open key intervals to values. Every key maps to some value; keys
  // never assigned keep the initial one.
  template <typename K, typename V> class interval_map {
  public:
    explicit interval_map(V const& initial) {
      intervals.insert(intervals.end(), std::make_pair(std::numeric_limits<K>::lowest(), initial));
    }

    // Maps [first, last) to value; keys from last on keep what they mapped to before.
    void assign(K const& first, K const& last, V const& value) {
      if (not(first < last))
        return;

      auto const value_behind = (*this)[last];

      intervals.erase(intervals.lower_bound(first), intervals.upper_bound(last));

      auto const at_first = intervals.emplace(first, value).first;
      auto const at_last  = intervals.emplace_hint(std::next(at_first), last, value_behind);

      if (at_last->second == value)
        intervals.erase(at_last);

      if (at_first != intervals.begin() and std::prev(at_first)->second == value)
        intervals.erase(at_first);
    }

    auto is_canonical() const noexcept -> bool {
      auto const position = std::adjacent_find(begin(intervals), end(intervals),
                                               [](auto&& lhs, auto&& rhs) { return lhs.second == rhs.second; });
      return position == end(intervals);
    }

    auto interval_count() const noexcept -> std::size_t {
      assert(is_canonical());
      return intervals.size();
    }

    // First key of the interval holding key.
    auto lower_key(K const& key) const noexcept -> K const& {
      return (--intervals.upper_bound(key))->first;
    }

    auto operator[](K const& key) const noexcept -> V const& {
      return (--intervals.upper_bound(key))->second;
    }

  private:
    std::map<K, V> intervals;
  };
} // namespace replacer::container
