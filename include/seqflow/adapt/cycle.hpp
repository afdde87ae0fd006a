#pragma once

#include <concepts>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "../detail/pull.hpp"
#include "../detail/utils_math.hpp"

namespace seqflow {
/**
 * @brief Endless repetition of a finite source
 *
 * The source is drained once, at construction, into immutable shared storage; copies are emitted from it forever.
 * A source reporting an `unbounded` estimate is rejected. An empty source gives an empty sequence.
 *
 * Splits into two cycles over the same storage, both positioned where this one was.
 */
template <typename T>
class cycle_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;
  using storage_type = std::shared_ptr<std::vector<T> const>;

  explicit cycle_seq(seq<T> src) : data(materialize(std::move(src))) {}

  cycle_seq(storage_type data, size_t pos) noexcept : data(std::move(data)), pos(pos) {}

  bool try_advance(sink_type sink) override {
    if (data->empty()) {
      return false;
    }
    sink(T((*data)[pos]));
    if (++pos == data->size()) {
      pos = 0;
    }
    return true;
  }

  std::unique_ptr<base> try_split() override {
    if (data->empty()) {
      return nullptr;
    }
    return std::make_unique<cycle_seq>(data, pos);
  }

  size_t estimate_size() const noexcept override { return data->empty() ? 0 : unbounded; }
  seq_props props() const noexcept override { return data->empty() ? ordered_sized : ordered_only; }

private:
  static storage_type materialize(seq<T> src) {
    detail::require_ordered(src, "cycle");
    if (src.estimate_size() == unbounded) {
      throw std::invalid_argument("cycle: source must be finite");
    }
    std::vector<T> out;
    if (src.props().sized) {
      out.reserve(src.estimate_size());
    }
    while (auto v = detail::pull_one(src)) {
      out.push_back(std::move(*v));
    }
    return std::make_shared<std::vector<T> const>(std::move(out));
  }

  storage_type data;
  size_t pos{0};
};

/**
 * @brief Each element emitted n times in a row
 *
 * Requires n >= 2 and a sized source. The last copy of an element is moved out, the others copied.
 */
template <typename T>
class repeat_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  template <std::integral I>
  repeat_seq(seq<T> src, I n) : src(std::move(src)), n(checked_times(n)) {
    detail::require_ordered(this->src, "repeat");
    if (!this->src.props().sized) {
      throw std::invalid_argument("repeat: source must be sized");
    }
  }

  bool try_advance(sink_type sink) override {
    if (remaining == 0) {
      cur = detail::pull_one(src);
      if (!cur) {
        return false;
      }
      remaining = n;
    }
    if (--remaining == 0) {
      sink(std::move(*cur));
      cur.reset();
    } else {
      sink(T(*cur));
    }
    return true;
  }

  std::unique_ptr<base> try_split() override {
    if (remaining != 0) {
      return nullptr;
    }
    auto prefix = src.try_split();
    return prefix ? std::make_unique<repeat_seq>(std::move(prefix), n) : nullptr;
  }

  size_t estimate_size() const noexcept override {
    return detail::sat_add(remaining, detail::sat_mul(src.estimate_size(), n));
  }
  // an exact size that saturates is no longer exact
  seq_props props() const noexcept override {
    auto const p = src.props().with_ordered().without_distinct();
    return estimate_size() == unbounded ? p.without_sized() : p;
  }

private:
  template <std::integral I>
  static size_t checked_times(I n) {
    if (std::cmp_less(n, 2)) {
      throw std::invalid_argument("repeat: count must be at least 2");
    }
    return static_cast<size_t>(n);
  }

  seq<T> src;
  size_t const n;
  std::optional<T> cur;
  size_t remaining{0};
};
} // namespace seqflow
