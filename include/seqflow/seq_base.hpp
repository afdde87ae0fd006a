#pragma once

#include <cstddef>
#include <memory>

#include "detail/sink_ref.hpp"
#include "props.hpp"

namespace seqflow {
/**
 * @brief Base class for pull-based sequences
 *
 * Every source and adapter implements this interface. A consumer pulls elements one at a time with try_advance().
 *
 * Contract:
 *
 * - try_advance(): if an element exists, the sink is invoked exactly once with it and true is returned. Otherwise the
 *   sink is not invoked and false is returned. Once false has been returned, every later call returns false.
 * - try_split(): may partition off a prefix of the remaining elements into a new, independent sequence. The returned
 *   prefix followed by the remainder of this sequence reproduces the original order. Returns nullptr when splitting is
 *   not supported, in particular after consumption started.
 * - estimate_size(): number of remaining elements. Exact if props().sized, otherwise an upper bound, or `unbounded`.
 * - props(): guarantees about the output, see @ref seq_props.
 *
 * An instance is advanced by one consumer at a time. Split halves own disjoint state and may be advanced from
 * different threads.
 *
 * @tparam T element type
 */
template <typename T>
struct seq_base {
  using value_type = T;
  using sink_type = detail::sink_ref<T>;

  virtual bool try_advance(sink_type sink) = 0;
  virtual std::unique_ptr<seq_base> try_split() { return nullptr; }

  virtual size_t estimate_size() const noexcept = 0;
  virtual seq_props props() const noexcept = 0;

  virtual ~seq_base() noexcept = default;
};
} // namespace seqflow
