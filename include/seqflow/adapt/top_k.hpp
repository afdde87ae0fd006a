#pragma once

#include <algorithm>
#include <concepts>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../detail/pull.hpp"
#include "../detail/top_table.hpp"

namespace seqflow {
namespace detail {
/**
 * @brief Common driver of the best-of-N filters
 *
 * Input is pulled one element at a time, but nothing can be emitted before the source is exhausted. The first
 * try_advance() drains the source into drain(), later calls hand out the retained elements one by one.
 *
 * Selection state cannot be merged across halves, so these adapters never split.
 */
template <typename T>
class top_k_base : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  top_k_base(seq<T> src, less_fn<T> less, char const *who) : src(std::move(src)), less(std::move(less)) {
    require_source(this->src, who);
    require_callable(this->less, who, "comparator");
  }

  bool try_advance(sink_type sink) override {
    if (!drained) {
      while (auto v = pull_one(src)) {
        accept(std::move(*v));
      }
      results = release();
      drained = true;
    }
    if (cursor == results.size()) {
      return false;
    }
    sink(std::move(results[cursor++]));
    return true;
  }

  size_t estimate_size() const noexcept override {
    return drained ? results.size() - cursor : bound(src.estimate_size());
  }

protected:
  virtual void accept(T &&v) = 0;
  virtual std::vector<T> release() = 0;
  virtual size_t bound(size_t src_size) const noexcept { return src_size; }

  seq<T> src;
  less_fn<T> less;

private:
  std::vector<T> results;
  size_t cursor{0};
  bool drained{false};
};

template <std::integral I>
size_t checked_top_n(I n, char const *who) {
  if (std::cmp_less(n, 2)) {
    throw std::invalid_argument(std::string(who) + ": number of maxes must be at least 2");
  }
  return static_cast<size_t>(n);
}
} // namespace detail

/**
 * @brief Every element equivalent to the maximum, in encounter order
 *
 * A strictly greater element resets the accumulated ties.
 */
template <typename T>
class all_max_seq : public detail::top_k_base<T> {
public:
  using base = detail::top_k_base<T>;

  all_max_seq(seq<T> src, less_fn<T> less) : base(std::move(src), std::move(less), "filter_all_max") {}

  seq_props props() const noexcept override { return this->src.props().without_sized(); }

protected:
  void accept(T &&v) override {
    if (maxes.empty() || this->less(maxes.front(), v)) {
      maxes.clear();
      maxes.push_back(std::move(v));
    } else if (!this->less(v, maxes.front())) {
      maxes.push_back(std::move(v));
    }
  }

  std::vector<T> release() override { return std::exchange(maxes, {}); }

private:
  std::vector<T> maxes; ///< all equivalent to maxes.front()
};

/**
 * @brief The n largest distinct keys, decreasing, one representative (the first seen) per key
 */
template <typename T>
class max_keys_seq : public detail::top_k_base<T> {
public:
  using base = detail::top_k_base<T>;

  template <std::integral I>
  max_keys_seq(seq<T> src, I n, less_fn<T> less)
      : base(std::move(src), std::move(less), "filter_max_keys"),
        table(detail::checked_top_n(n, "filter_max_keys"), this->less, false) {}

  seq_props props() const noexcept override { return this->src.props().without_sized().without_sorted(); }

protected:
  void accept(T &&v) override { table.offer(std::move(v)); }
  std::vector<T> release() override { return table.release_all(); }
  size_t bound(size_t src_size) const noexcept override { return std::min(src_size, table.capacity()); }

private:
  detail::top_table<T> table;
};

/**
 * @brief Every occurrence of the n largest distinct keys
 *
 * Output is grouped by decreasing key, occurrences in encounter order. A tied key is never split: the output can be
 * longer than n.
 */
template <typename T>
class max_values_seq : public detail::top_k_base<T> {
public:
  using base = detail::top_k_base<T>;

  template <std::integral I>
  max_values_seq(seq<T> src, I n, less_fn<T> less)
      : base(std::move(src), std::move(less), "filter_max_values"),
        table(detail::checked_top_n(n, "filter_max_values"), this->less, true) {}

  seq_props props() const noexcept override { return this->src.props().without_sized().without_sorted(); }

protected:
  void accept(T &&v) override { table.offer(std::move(v)); }
  std::vector<T> release() override { return table.release_all(); }

private:
  detail::top_table<T> table;
};
} // namespace seqflow
