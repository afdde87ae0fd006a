#pragma once

#include <algorithm>
#include <concepts>
#include <memory>
#include <stdexcept>
#include <utility>

#include "../common.hpp"
#include "../def.hpp"
#include "../detail/pull.hpp"

namespace seqflow {
enum class gate_state {
  waiting, ///< gate closed, nothing passes or accumulates
  open,    ///< elements pass (or accumulate, for grouping)
  ready,   ///< a segment is complete and waits to be emitted
};

/**
 * @brief Drops elements until the gate predicate first holds, then passes everything
 *
 * The opening element is emitted. The gate never re-closes.
 */
template <typename T>
class gate_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  gate_seq(seq<T> src, pred_fn<T> pred) : src(std::move(src)), pred(std::move(pred)) {
    detail::require_source(this->src, "gate");
    detail::require_callable(this->pred, "gate", "predicate");
  }

  bool try_advance(sink_type sink) override {
    if (done) {
      return false;
    }
    started = true;
    while (true) {
      auto v = detail::pull_one(src);
      if (!v) {
        done = true;
        return false;
      }
      if (state == gate_state::open || pred(*v)) {
        state = gate_state::open;
        sink(std::move(*v));
        return true;
      }
    }
  }

  std::unique_ptr<base> try_split() override {
    if (started) {
      return nullptr;
    }
    auto prefix = src.try_split();
    return prefix ? std::make_unique<gate_seq>(std::move(prefix), pred) : nullptr;
  }

  SEQFLOW_SEQ_DEFAULTS(src.props().without_sized())

  gate_state current_state() const noexcept { return state; }

private:
  seq<T> src;
  pred_fn<T> pred;
  gate_state state{gate_state::waiting};
  bool started{false};
  bool done{false};
};

/**
 * @brief Passes elements until the interruptor first holds
 *
 * The interrupting element and everything after it are dropped, and the source is not pulled again.
 */
template <typename T>
class interrupt_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  interrupt_seq(seq<T> src, pred_fn<T> interruptor) : src(std::move(src)), interruptor(std::move(interruptor)) {
    detail::require_source(this->src, "interrupt");
    detail::require_callable(this->interruptor, "interrupt", "interruptor");
  }

  bool try_advance(sink_type sink) override {
    if (done) {
      return false;
    }
    started = true;
    auto v = detail::pull_one(src);
    if (!v || interruptor(*v)) {
      done = true;
      return false;
    }
    sink(std::move(*v));
    return true;
  }

  std::unique_ptr<base> try_split() override {
    if (started) {
      return nullptr;
    }
    auto prefix = src.try_split();
    return prefix ? std::make_unique<interrupt_seq>(std::move(prefix), interruptor) : nullptr;
  }

  size_t estimate_size() const noexcept override { return done ? 0 : src.estimate_size(); }
  seq_props props() const noexcept override { return src.props().without_sized(); }

private:
  seq<T> src;
  pred_fn<T> interruptor;
  bool started{false};
  bool done{false};
};

/**
 * @brief Passes at most the first n elements
 *
 * n == 0 yields an empty sequence without pulling. The source is never pulled past the limit. Splits only a sized
 * source, handing the prefix min(n, prefix size) and the remainder what is left, so the halves reproduce the original.
 */
template <typename T>
class limit_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  template <std::integral I>
  limit_seq(seq<T> src, I limit) : src(std::move(src)), limit(checked_limit(limit)) {
    detail::require_source(this->src, "limit_at_most");
  }

  bool try_advance(sink_type sink) override {
    if (done || taken >= limit) {
      return false;
    }
    auto v = detail::pull_one(src);
    if (!v) {
      done = true;
      return false;
    }
    ++taken;
    sink(std::move(*v));
    return true;
  }

  std::unique_ptr<base> try_split() override {
    if (taken > 0 || done || !src.props().sized) {
      return nullptr;
    }
    auto prefix = src.try_split();
    if (!prefix) {
      return nullptr;
    }
    auto const head = std::min(limit, prefix.estimate_size());
    limit -= head;
    return std::make_unique<limit_seq>(std::move(prefix), head);
  }

  size_t estimate_size() const noexcept override { return done ? 0 : std::min(limit - taken, src.estimate_size()); }
  seq_props props() const noexcept override { return src.props(); }

private:
  template <std::integral I>
  static size_t checked_limit(I limit) {
    if (std::cmp_less(limit, 0)) {
      throw std::invalid_argument("limit_at_most: limit must not be negative");
    }
    return static_cast<size_t>(limit);
  }

  seq<T> src;
  size_t limit;
  size_t taken{0};
  bool done{false};
};
} // namespace seqflow
