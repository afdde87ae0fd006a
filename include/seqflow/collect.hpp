#pragma once

#include <concepts>
#include <cstddef>
#include <utility>
#include <vector>

#include "seq.hpp"

// Terminal operations: drain a sequence from the calling thread.
namespace seqflow {
template <typename T, typename F>
  requires std::invocable<F &, T &&>
void for_each(seq<T> &src, F &&fn) {
  while (src.try_advance([&fn](T &&v) { fn(std::move(v)); })) {
  }
}

template <typename T, typename F>
  requires std::invocable<F &, T &&>
void for_each(seq<T> &&src, F &&fn) {
  for_each(src, std::forward<F>(fn));
}

template <typename T>
std::vector<T> to_vector(seq<T> &src) {
  std::vector<T> out;
  if (auto const hint = src.estimate_size(); src.props().sized) {
    out.reserve(hint);
  }
  for_each(src, [&out](T &&v) { out.push_back(std::move(v)); });
  return out;
}

template <typename T>
std::vector<T> to_vector(seq<T> &&src) {
  return to_vector(src);
}

/// Drain a sequence of sequences, e.g. the output of roll() or group()
template <typename T>
std::vector<std::vector<T>> to_vectors(seq<seq<T>> &src) {
  std::vector<std::vector<T>> out;
  for_each(src, [&out](seq<T> &&inner) { out.push_back(to_vector(inner)); });
  return out;
}

template <typename T>
std::vector<std::vector<T>> to_vectors(seq<seq<T>> &&src) {
  return to_vectors(src);
}

/// Number of elements, draining the sequence. Never returns for an infinite one.
template <typename T>
size_t count(seq<T> &src) {
  size_t n = 0;
  for_each(src, [&n](T &&) { ++n; });
  return n;
}

template <typename T>
size_t count(seq<T> &&src) {
  return count(src);
}
} // namespace seqflow
