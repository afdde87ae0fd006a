#pragma once

#include <cstddef>

#include "../common.hpp"

// Size-estimate arithmetic. `unbounded` is absorbing and every operation saturates instead of wrapping.
namespace seqflow::detail {
constexpr inline size_t sat_add(size_t a, size_t b) noexcept {
  if (a == unbounded || b == unbounded || a > unbounded - b) {
    return unbounded;
  }
  return a + b;
}

/// a - b, floored at 0
constexpr inline size_t sat_sub(size_t a, size_t b) noexcept {
  if (a == unbounded) {
    return unbounded;
  }
  return a > b ? a - b : 0;
}

constexpr inline size_t sat_mul(size_t a, size_t b) noexcept {
  if (a == 0 || b == 0) {
    return 0;
  }
  if (a == unbounded || b == unbounded || a > unbounded / b) {
    return unbounded;
  }
  return a * b;
}

constexpr inline size_t sat_div(size_t a, size_t b) noexcept { return a == unbounded ? unbounded : a / b; }

/// n * (n - 1) / 2 without intermediate overflow
constexpr inline size_t sat_pairs(size_t n) noexcept {
  if (n < 2) {
    return 0;
  }
  return n % 2 == 0 ? sat_mul(n / 2, n - 1) : sat_mul(n, (n - 1) / 2);
}
} // namespace seqflow::detail
