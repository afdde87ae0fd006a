#pragma once

#include <optional>
#include <utility>

#include "../error.hpp"
#include "../seq.hpp"

namespace seqflow::detail {
/**
 * @brief Pull exactly one element from an upstream sequence
 *
 * The only way adapters read their source. Enforces the advance protocol on the upstream: a second sink invocation,
 * or a result flag that disagrees with the invocation, throws contract_error.
 *
 * @return the element, or std::nullopt if the source is exhausted
 */
template <typename T>
std::optional<T> pull_one(seq<T> &src) {
  std::optional<T> slot;
  bool const more = src.try_advance([&slot](T &&v) {
    if (slot.has_value()) {
      throw contract_error("pull_one: source invoked the sink twice in one advance");
    }
    slot.emplace(std::move(v));
  });
  if (more != slot.has_value()) {
    throw contract_error(more ? "pull_one: source returned true without producing an element"
                              : "pull_one: source produced an element but returned false");
  }
  return slot;
}
} // namespace seqflow::detail
