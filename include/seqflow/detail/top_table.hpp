#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

#include "../common.hpp"

namespace seqflow::detail {
/**
 * @brief Bounded table of the largest distinct keys
 *
 * Keys are comparator-equivalence classes, held in strictly decreasing order, at most `capacity` of them. When
 * `keep_ties` is set, a companion list per key records every element seen for it, in encounter order; it is inserted
 * and evicted together with its key.
 *
 * Small tables are scanned linearly, larger ones binary searched.
 */
template <typename T, size_t BIN_THRES = 64>
class top_table {
public:
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;

  enum class offer_result {
    rejected, ///< not larger than the smallest key of a full table
    tied,     ///< equivalent to a retained key
    inserted, ///< new key, possibly evicting the smallest one
  };

  top_table(size_type capacity, less_fn<T> less, bool keep_ties)
      : cap(capacity), less(std::move(less)), keep_ties(keep_ties) {
    assert(cap > 0 && "[BUG] Top table with zero capacity.");
    keys.reserve(cap);
    if (keep_ties) {
      ties.reserve(cap);
    }
  }

  offer_result offer(T value) {
    auto const idx = rank(value);
    if (idx < keys.size() && !less(keys[idx], value)) {
      if (keep_ties) {
        ties[idx].push_back(std::move(value));
      }
      return offer_result::tied;
    }
    if (idx >= cap) {
      return offer_result::rejected;
    }
    if (keys.size() == cap) {
      keys.pop_back();
      if (keep_ties) {
        ties.pop_back();
      }
    }
    auto const pos = static_cast<difference_type>(idx);
    if (keep_ties) {
      ties.insert(ties.begin() + pos, std::vector<T>{value});
    }
    keys.insert(keys.begin() + pos, std::move(value));
    return offer_result::inserted;
  }

  /// Position of the first retained key not greater than `value`
  size_type rank(T const &value) const {
    if (keys.size() > BIN_THRES) {
      auto it = std::lower_bound(keys.begin(), keys.end(), value,
                                 [this](T const &key, T const &v) { return less(v, key); });
      return static_cast<size_type>(std::distance(keys.begin(), it));
    }
    auto it = std::find_if(keys.begin(), keys.end(), [this, &value](T const &key) { return !less(value, key); });
    return static_cast<size_type>(std::distance(keys.begin(), it));
  }

  std::vector<T> const &retained_keys() const noexcept { return keys; }

  std::vector<T> const &ties_of(size_type idx) const {
    assert(keep_ties && "[BUG] Tie lists requested from a key-only table.");
    assert(idx < ties.size() && "Index out of bounds");
    return ties[idx];
  }

  /// Every retained element, grouped by decreasing key
  std::vector<T> release_all() {
    if (!keep_ties) {
      return std::exchange(keys, {});
    }
    std::vector<T> out;
    for (auto &group : ties) {
      std::move(group.begin(), group.end(), std::back_inserter(out));
    }
    keys.clear();
    ties.clear();
    return out;
  }

  size_type size() const noexcept { return keys.size(); }
  size_type capacity() const noexcept { return cap; }
  bool empty() const noexcept { return keys.empty(); }

private:
  size_type const cap;
  less_fn<T> less;
  bool const keep_ties;
  std::vector<T> keys;              ///< strictly decreasing
  std::vector<std::vector<T>> ties; ///< ties[i] holds every element equivalent to keys[i]
};
} // namespace seqflow::detail
