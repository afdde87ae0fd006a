#pragma once

#include <concepts>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../detail/pull.hpp"
#include "../detail/utils.hpp"
#include "../detail/utils_math.hpp"
#include "../detail/window_buffer.hpp"
#include "../source.hpp"

namespace seqflow {
enum class window_kind {
  rolling,  ///< every contiguous window, start advances by one element
  grouping, ///< consecutive non-overlapping chunks, trailing partial chunk dropped
};

namespace detail {
/**
 * @brief Buffering shared by the window adapters
 *
 * Owns the source and a circular buffer of width + 1 slots. The first next() primes the buffer with `width`
 * elements. Each later call first retires the previous window: rolling pulls one element into the spare slot and
 * then drops the oldest, grouping drops the whole previous chunk and refills. The window starting at the read cursor
 * is then copied out and stays buffered until the next call.
 *
 * | source    | kind     | windows                   |
 * |-----------|----------|---------------------------|
 * | 1..7      | rolling  | 123 234 345 456 567       |
 * | 1..7      | grouping | 123 456 (7 never emitted) |
 */
template <typename T>
class window_core {
public:
  window_core(seq<T> src, size_t width, window_kind kind)
      : src(std::move(src)), buf(width + 1), width(width), kind(kind) {}

  std::optional<std::vector<T>> next() {
    if (done) {
      return std::nullopt;
    }
    if (started) {
      if (kind == window_kind::rolling) {
        if (!fill(width + 1)) {
          return std::nullopt;
        }
        buf.pop(1);
      } else {
        buf.pop(width);
      }
    }
    if (!fill(width)) {
      return std::nullopt;
    }
    started = true;
    return buf.copy_front(width);
  }

  size_t estimate_size() const noexcept {
    if (done) {
      return 0;
    }
    // the window last emitted is still buffered
    auto const retired = started ? (kind == window_kind::rolling ? size_t{1} : width) : size_t{0};
    auto const avail = sat_add(src.estimate_size(), buf.size() - retired);
    return kind == window_kind::rolling ? sat_sub(avail, width - 1) : sat_div(avail, width);
  }

  seq_props props() const noexcept { return src.props().structural(); }

  /// Split the untouched source; none once a window was produced or elements were buffered
  seq<T> split_source() {
    if (started || !buf.empty() || done) {
      return seq<T>{};
    }
    return src.try_split();
  }

  size_t window_width() const noexcept { return width; }
  window_kind window_mode() const noexcept { return kind; }

private:
  // pull until n elements are buffered
  bool fill(size_t n) {
    while (buf.size() < n) {
      auto v = pull_one(src);
      if (!v) {
        done = true;
        return false;
      }
      buf.push(std::move(*v));
    }
    return true;
  }

  seq<T> src;
  window_buffer<T> buf;
  size_t const width;
  window_kind const kind;
  bool started{false};
  bool done{false};
};

template <std::integral I>
size_t checked_width(I width, char const *who) {
  if (std::cmp_less(width, 2)) {
    throw std::invalid_argument(std::string(who) + ": width must be at least 2");
  }
  if (std::cmp_greater_equal(width, std::numeric_limits<size_t>::max())) {
    throw std::invalid_argument(std::string(who) + ": width too large");
  }
  return static_cast<size_t>(width);
}
} // namespace detail

/**
 * @brief Rolling / grouping window adapter
 *
 * Emits each window as a fresh finite, ordered and sized sequence. Requires an ordered source and width >= 2.
 * Splitting delegates to the source; windows never span the split boundary.
 */
template <typename T>
class window_seq : public seq_base<seq<T>> {
public:
  using base = seq_base<seq<T>>;
  using typename base::sink_type;

  template <std::integral I>
  window_seq(seq<T> src, I width, window_kind kind)
      : core(validated(std::move(src), kind), detail::checked_width(width, name(kind)), kind) {}

  bool try_advance(sink_type sink) override {
    auto win = core.next();
    if (!win) {
      return false;
    }
    sink(from_vector(std::move(*win)));
    return true;
  }

  std::unique_ptr<base> try_split() override {
    auto prefix = core.split_source();
    if (!prefix) {
      return nullptr;
    }
    return std::make_unique<window_seq>(std::move(prefix), core.window_width(), core.window_mode());
  }

  size_t estimate_size() const noexcept override { return core.estimate_size(); }
  seq_props props() const noexcept override { return core.props(); }

private:
  static char const *name(window_kind kind) noexcept { return kind == window_kind::rolling ? "roll" : "group"; }

  static seq<T> validated(seq<T> src, window_kind kind) {
    detail::require_ordered(src, name(kind));
    return src;
  }

  detail::window_core<T> core;
};

/**
 * @brief Rolling window followed by a reduction
 *
 * Same buffering as window_seq, but each window is handed to `reducer` as a contiguous span and the result emitted.
 * Generalises the shifting-window average and summary helpers.
 */
template <typename T, typename R>
class window_reduce_seq : public seq_base<R> {
public:
  using base = seq_base<R>;
  using typename base::sink_type;
  using reducer_type = std::function<R(std::span<T const>)>;

  template <std::integral I>
  window_reduce_seq(seq<T> src, I width, reducer_type reducer)
      : core(validated(std::move(src)), detail::checked_width(width, "window_reduce"), window_kind::rolling),
        reducer(std::move(reducer)) {
    detail::require_callable(this->reducer, "window_reduce", "reducer");
  }

  bool try_advance(sink_type sink) override {
    auto win = core.next();
    if (!win) {
      return false;
    }
    sink(reducer(detail::as_span(*win)));
    return true;
  }

  std::unique_ptr<base> try_split() override {
    auto prefix = core.split_source();
    if (!prefix) {
      return nullptr;
    }
    return std::make_unique<window_reduce_seq>(std::move(prefix), core.window_width(), reducer);
  }

  size_t estimate_size() const noexcept override { return core.estimate_size(); }
  seq_props props() const noexcept override { return core.props(); }

private:
  static seq<T> validated(seq<T> src) {
    detail::require_ordered(src, "window_reduce");
    return src;
  }

  detail::window_core<T> core;
  reducer_type reducer;
};
} // namespace seqflow
