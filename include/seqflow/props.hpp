#pragma once

#include <ranges>

namespace seqflow {
/**
 * @brief Property set of a sequence
 *
 * Guarantees an adapter reports about its output. An adapter must revoke every guarantee it cannot keep, e.g. a
 * window adapter over a sorted source does not emit sorted windows.
 *
 * - ordered:  elements have a defined encounter order
 * - sized:    estimate_size() is exact
 * - sorted:   elements are in non-decreasing order
 * - distinct: no two elements compare equal
 */
struct seq_props {
  bool ordered{};
  bool sized{};
  bool sorted{};
  bool distinct{};

  /// Guarantees held by both sets, for adapters that merge several sources
  constexpr seq_props intersect(seq_props const &other) const noexcept {
    return {.ordered = ordered && other.ordered,
            .sized = sized && other.sized,
            .sorted = sorted && other.sorted,
            .distinct = distinct && other.distinct};
  }

  constexpr seq_props without_sized() const noexcept {
    auto p = *this;
    p.sized = false;
    return p;
  }

  constexpr seq_props without_sorted() const noexcept {
    auto p = *this;
    p.sorted = false;
    return p;
  }

  constexpr seq_props without_distinct() const noexcept {
    auto p = *this;
    p.distinct = false;
    return p;
  }

  constexpr seq_props with_ordered() const noexcept {
    auto p = *this;
    p.ordered = true;
    return p;
  }

  /// Drop the element-level guarantees (sorted, distinct). Used by adapters emitting new values or sub-sequences.
  constexpr seq_props structural() const noexcept { return without_sorted().without_distinct(); }

  friend constexpr bool operator==(seq_props const &, seq_props const &) noexcept = default;
};

constexpr inline seq_props ordered_sized{.ordered = true, .sized = true};
constexpr inline seq_props ordered_only{.ordered = true};

template <std::ranges::input_range R>
constexpr seq_props intersect_all(R &&props) noexcept {
  seq_props acc{.ordered = true, .sized = true, .sorted = true, .distinct = true};
  for (auto const &p : props) {
    acc = acc.intersect(p);
  }
  return acc;
}
} // namespace seqflow
