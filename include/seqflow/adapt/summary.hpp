#pragma once

#include <cstddef>
#include <span>
#include <type_traits>

#include "../common.hpp"

namespace seqflow {
/**
 * @brief Count, sum, min and max of a window
 *
 * Integral inputs are summed in a 64-bit accumulator of the same signedness, floating-point inputs in double.
 */
template <arithmetic T>
struct summary {
  using sum_type = std::conditional_t<std::is_floating_point_v<T>, double,
                                      std::conditional_t<std::is_signed_v<T>, long long, unsigned long long>>;

  size_t count{};
  sum_type sum{};
  T min{};
  T max{};

  double average() const noexcept { return count == 0 ? 0.0 : static_cast<double>(sum) / static_cast<double>(count); }

  void add(T v) noexcept {
    if (count == 0) {
      min = v;
      max = v;
    } else {
      if (v < min)
        min = v;
      if (max < v)
        max = v;
    }
    sum += static_cast<sum_type>(v);
    ++count;
  }

  friend bool operator==(summary const &, summary const &) noexcept = default;
};

template <arithmetic T>
summary<T> summarize(std::span<T const> win) noexcept {
  summary<T> s;
  for (auto v : win) {
    s.add(v);
  }
  return s;
}

template <arithmetic T>
double average_of(std::span<T const> win) noexcept {
  return summarize(win).average();
}
} // namespace seqflow
