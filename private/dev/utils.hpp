#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <random>
#include <ranges>
#include <type_traits>
#include <vector>

#include "seqflow/source.hpp"

// Randomised inputs for tests and benchmarks. Pass a seed for reproducible data.
namespace utils {
namespace detail {
inline std::mt19937 make_engine(std::optional<unsigned int> seed) {
  std::mt19937 gen;
  if (seed.has_value()) {
    gen.seed(seed.value());
  } else {
    std::random_device rd;
    gen.seed(rd());
  }
  return gen;
}
} // namespace detail

template <typename T>
concept arithmetic = std::is_arithmetic_v<T>;

// n values drawn uniformly from [min, max]
template <arithmetic T>
std::vector<T> make_unif_vector(size_t n, T min, T max, std::optional<unsigned int> seed = std::nullopt) {
  auto gen = detail::make_engine(seed);
  std::vector<T> out;
  out.reserve(n);
  if constexpr (std::floating_point<T>) {
    std::uniform_real_distribution<T> dist(min, max);
    std::ranges::generate_n(std::back_inserter(out), static_cast<std::ptrdiff_t>(n), [&] { return dist(gen); });
  } else {
    std::uniform_int_distribution<T> dist(min, max);
    std::ranges::generate_n(std::back_inserter(out), static_cast<std::ptrdiff_t>(n), [&] { return dist(gen); });
  }
  return out;
}

// Same values as make_unif_vector, as an ordered sized sequence
template <arithmetic T>
seqflow::seq<T> make_unif_seq(size_t n, T min, T max, std::optional<unsigned int> seed = std::nullopt) {
  return seqflow::from_vector(make_unif_vector(n, min, max, seed));
}

// n picks from `choices`, with replacement
template <std::ranges::random_access_range Range>
auto make_unif_choice(size_t n, Range const &choices, std::optional<unsigned int> seed = std::nullopt) {
  using value_type = std::ranges::range_value_t<Range>;
  auto gen = detail::make_engine(seed);
  std::uniform_int_distribution<size_t> dist(0, std::ranges::size(choices) - 1);
  std::vector<value_type> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    out.push_back(choices[dist(gen)]);
  }
  return out;
}

template <typename Range>
auto make_unif_shuffle(Range range, std::optional<unsigned int> seed = std::nullopt) {
  auto gen = detail::make_engine(seed);
  std::ranges::shuffle(range, gen);
  return range;
}
} // namespace utils
