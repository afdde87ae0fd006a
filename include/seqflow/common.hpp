#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace seqflow {
/// Size estimate meaning "unknown or unbounded".
constexpr inline size_t unbounded = std::numeric_limits<size_t>::max();

namespace detail {
template <typename T, template <typename...> class Tmpl>
struct is_specialization : std::false_type {};

template <template <typename...> class Tmpl, typename... Args>
struct is_specialization<Tmpl<Args...>, Tmpl> : std::true_type {};
} // namespace detail

// Concepts

template <typename T>
concept arithmetic = std::is_arithmetic_v<T>;

template <typename F, typename T>
concept predicate_of = std::predicate<F const &, T const &>;

template <typename F, typename T>
concept less_of = std::relation<F const &, T const &, T const &>;

template <typename F, typename T>
concept binary_op_of = std::invocable<F const &, T const &, T const &> &&
                       std::convertible_to<std::invoke_result_t<F const &, T const &, T const &>, T>;

/// Types whose value can be "absent": a zipping function must never produce one.
template <typename R>
concept nullable = std::is_pointer_v<R> || detail::is_specialization<R, std::optional>::value ||
                   detail::is_specialization<R, std::shared_ptr>::value ||
                   detail::is_specialization<R, std::unique_ptr>::value;

// Erased callables stored by adapters. Empty std::function objects are rejected at construction.

template <typename T>
using pred_fn = std::function<bool(T const &)>;

template <typename T>
using less_fn = std::function<bool(T const &, T const &)>;

template <typename T>
using binary_fn = std::function<T(T const &, T const &)>;
} // namespace seqflow
