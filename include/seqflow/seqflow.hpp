#pragma once

#include <concepts>
#include <functional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "adapt/accumulate.hpp"
#include "adapt/cross_product.hpp"
#include "adapt/cycle.hpp"
#include "adapt/gate.hpp"
#include "adapt/group_gate.hpp"
#include "adapt/summary.hpp"
#include "adapt/top_k.hpp"
#include "adapt/traverse.hpp"
#include "adapt/validate.hpp"
#include "adapt/window.hpp"
#include "adapt/zip.hpp"
#include "check.hpp"
#include "collect.hpp"
#include "source.hpp"

// Entry points. Each one validates its arguments eagerly (through the adapter constructor) and takes ownership of
// the source sequence(s).
namespace seqflow {
// Multi-source combinators

template <typename T>
seq<T> cycle(seq<T> src) {
  return make_seq<cycle_seq<T>>(std::move(src));
}

template <typename T, std::integral I>
seq<T> repeat(seq<T> src, I n) {
  return make_seq<repeat_seq<T>>(std::move(src), n);
}

template <typename T>
seq<seq<T>> traverse(std::vector<seq<T>> srcs) {
  return make_seq<traverse_seq<T>>(std::move(srcs));
}

template <typename T, typename... Rest>
  requires(std::same_as<Rest, seq<T>> && ...)
seq<seq<T>> traverse(seq<T> first, Rest... rest) {
  std::vector<seq<T>> srcs;
  srcs.reserve(1 + sizeof...(Rest));
  srcs.push_back(std::move(first));
  (srcs.push_back(std::move(rest)), ...);
  return traverse(std::move(srcs));
}

template <typename T>
seq<T> weave(std::vector<seq<T>> srcs) {
  return make_seq<weave_seq<T>>(std::move(srcs));
}

template <typename T, typename... Rest>
  requires(std::same_as<Rest, seq<T>> && ...)
seq<T> weave(seq<T> first, Rest... rest) {
  std::vector<seq<T>> srcs;
  srcs.reserve(1 + sizeof...(Rest));
  srcs.push_back(std::move(first));
  (srcs.push_back(std::move(rest)), ...);
  return weave(std::move(srcs));
}

template <typename A, typename B, typename F>
  requires std::invocable<F const &, A const &, B const &>
auto zip(seq<A> a, seq<B> b, F fn) {
  using R = std::decay_t<std::invoke_result_t<F const &, A const &, B const &>>;
  return make_seq<zip_seq<A, B, R>>(std::move(a), std::move(b), std::function<R(A const &, B const &)>(std::move(fn)));
}

// Windows

template <typename T, std::integral I>
seq<seq<T>> roll(seq<T> src, I width) {
  return make_seq<window_seq<T>>(std::move(src), width, window_kind::rolling);
}

template <typename T, std::integral I>
seq<seq<T>> group(seq<T> src, I width) {
  return make_seq<window_seq<T>>(std::move(src), width, window_kind::grouping);
}

template <typename T, typename F, std::integral I>
  requires std::invocable<F &, std::span<T const>>
auto window_reduce(seq<T> src, I width, F reducer) {
  using R = std::decay_t<std::invoke_result_t<F &, std::span<T const>>>;
  return make_seq<window_reduce_seq<T, R>>(std::move(src), width,
                                           std::function<R(std::span<T const>)>(std::move(reducer)));
}

template <arithmetic T, std::integral I>
seq<double> window_average(seq<T> src, I width) {
  return window_reduce(std::move(src), width, [](std::span<T const> win) { return average_of(win); });
}

template <arithmetic T, std::integral I>
seq<summary<T>> window_summary(seq<T> src, I width) {
  return window_reduce(std::move(src), width, [](std::span<T const> win) { return summarize(win); });
}

// Gated grouping

template <typename T, predicate_of<T> Open, predicate_of<T> Close>
seq<seq<T>> group(seq<T> src, Open open, bool open_included, Close close, bool close_included) {
  return make_seq<group_gate_seq<T>>(std::move(src), pred_fn<T>(std::move(open)), open_included,
                                     pred_fn<T>(std::move(close)), close_included);
}

/// Both boundary elements included
template <typename T, predicate_of<T> Open, predicate_of<T> Close>
seq<seq<T>> group(seq<T> src, Open open, Close close) {
  return group(std::move(src), std::move(open), true, std::move(close), true);
}

template <typename T, predicate_of<T> Splitter>
seq<seq<T>> group(seq<T> src, Splitter splitter, bool included) {
  return make_seq<group_gate_seq<T>>(std::move(src), pred_fn<T>(std::move(splitter)), included);
}

/// Splitter included in the segment it opens
template <typename T, predicate_of<T> Splitter>
seq<seq<T>> group(seq<T> src, Splitter splitter) {
  return group(std::move(src), std::move(splitter), true);
}

// Element-wise and gating

template <typename T, predicate_of<T> P, typename FV, typename FI>
  requires std::invocable<FV const &, T const &> && std::invocable<FI const &, T const &>
auto validate(seq<T> src, P validator, FV if_valid, FI if_invalid) {
  using R = std::decay_t<std::invoke_result_t<FV const &, T const &>>;
  using fn_type = std::function<R(T const &)>;
  return make_seq<validate_seq<T, R>>(std::move(src), pred_fn<T>(std::move(validator)), fn_type(std::move(if_valid)),
                                      fn_type(std::move(if_invalid)));
}

/// Valid elements pass through unchanged
template <typename T, predicate_of<T> P, typename FI>
  requires std::invocable<FI const &, T const &>
seq<T> validate(seq<T> src, P validator, FI if_invalid) {
  return validate(std::move(src), std::move(validator), [](T const &v) { return v; }, std::move(if_invalid));
}

template <typename T, predicate_of<T> P>
seq<T> interrupt(seq<T> src, P interruptor) {
  return make_seq<interrupt_seq<T>>(std::move(src), pred_fn<T>(std::move(interruptor)));
}

template <typename T, predicate_of<T> P>
seq<T> gate(seq<T> src, P pred) {
  return make_seq<gate_seq<T>>(std::move(src), pred_fn<T>(std::move(pred)));
}

template <typename T, std::integral I>
seq<T> limit_at_most(seq<T> src, I limit) {
  return make_seq<limit_seq<T>>(std::move(src), limit);
}

// Running reductions

template <typename T, binary_op_of<T> F>
seq<T> accumulate(seq<T> src, F op) {
  return make_seq<accumulate_seq<T>>(std::move(src), binary_fn<T>(std::move(op)));
}

template <typename K, typename V, binary_op_of<V> F>
seq<std::pair<K, V>> accumulate_keyed(seq<std::pair<K, V>> src, F op) {
  return make_seq<accumulate_keyed_seq<K, V>>(std::move(src), binary_fn<V>(std::move(op)));
}

// Cross products

template <typename T>
seq<std::pair<T, T>> cross_product(seq<T> src) {
  return make_seq<cross_product_seq<T>>(std::move(src), cross_policy::full);
}

template <typename T>
seq<std::pair<T, T>> cross_product_no_self_pairs(seq<T> src) {
  return make_seq<cross_product_seq<T>>(std::move(src), cross_policy::no_self_pairs);
}

template <typename T, less_of<T> L>
seq<std::pair<T, T>> cross_product_ordered(seq<T> src, L less) {
  return make_seq<cross_product_seq<T>>(std::move(src), cross_policy::ordered, less_fn<T>(std::move(less)));
}

template <typename T>
seq<std::pair<T, T>> cross_product_naturally_ordered(seq<T> src) {
  return cross_product_ordered(std::move(src), std::less<T>{});
}

// Best-of-N filters

template <typename T, less_of<T> L>
seq<T> filter_all_max(seq<T> src, L less) {
  return make_seq<all_max_seq<T>>(std::move(src), less_fn<T>(std::move(less)));
}

template <typename T>
seq<T> filter_all_max(seq<T> src) {
  return filter_all_max(std::move(src), std::less<T>{});
}

template <typename T, std::integral I, less_of<T> L>
seq<T> filter_max_keys(seq<T> src, I n, L less) {
  return make_seq<max_keys_seq<T>>(std::move(src), n, less_fn<T>(std::move(less)));
}

template <typename T, std::integral I, less_of<T> L>
seq<T> filter_max_values(seq<T> src, I n, L less) {
  return make_seq<max_values_seq<T>>(std::move(src), n, less_fn<T>(std::move(less)));
}
} // namespace seqflow
