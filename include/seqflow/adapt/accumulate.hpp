#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "../common.hpp"
#include "../def.hpp"
#include "../detail/pull.hpp"

namespace seqflow {
/**
 * @brief Running left-to-right reduction
 *
 * The first element is emitted unchanged and seeds the accumulator; each later element e emits acc = op(acc, e).
 * `op` need not be associative. Requires an ordered source.
 *
 * Splitting delegates to the source: each half restarts its own accumulation, there is no merge.
 */
template <typename T>
class accumulate_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  accumulate_seq(seq<T> src, binary_fn<T> op) : src(std::move(src)), op(std::move(op)) {
    detail::require_ordered(this->src, "accumulate");
    detail::require_callable(this->op, "accumulate", "operator");
  }

  bool try_advance(sink_type sink) override {
    auto v = detail::pull_one(src);
    if (!v) {
      return false;
    }
    acc = acc ? op(*acc, *v) : std::move(*v);
    sink(T(*acc));
    return true;
  }

  std::unique_ptr<base> try_split() override {
    if (acc) {
      return nullptr;
    }
    auto prefix = src.try_split();
    return prefix ? std::make_unique<accumulate_seq>(std::move(prefix), op) : nullptr;
  }

  SEQFLOW_SEQ_DEFAULTS(src.props().structural())

private:
  seq<T> src;
  binary_fn<T> op;
  std::optional<T> acc;
};

/**
 * @brief Running reduction over the value half of key/value pairs
 *
 * Keys pass through untouched; each pair is re-emitted with its value replaced by the running result.
 */
template <typename K, typename V>
class accumulate_keyed_seq : public seq_base<std::pair<K, V>> {
public:
  using base = seq_base<std::pair<K, V>>;
  using typename base::sink_type;
  using entry_type = std::pair<K, V>;

  accumulate_keyed_seq(seq<entry_type> src, binary_fn<V> op) : src(std::move(src)), op(std::move(op)) {
    detail::require_ordered(this->src, "accumulate_keyed");
    detail::require_callable(this->op, "accumulate_keyed", "operator");
  }

  bool try_advance(sink_type sink) override {
    auto entry = detail::pull_one(src);
    if (!entry) {
      return false;
    }
    acc = acc ? op(*acc, entry->second) : entry->second;
    entry->second = *acc;
    sink(std::move(*entry));
    return true;
  }

  std::unique_ptr<base> try_split() override {
    if (acc) {
      return nullptr;
    }
    auto prefix = src.try_split();
    return prefix ? std::make_unique<accumulate_keyed_seq>(std::move(prefix), op) : nullptr;
  }

  SEQFLOW_SEQ_DEFAULTS(src.props().structural())

private:
  seq<entry_type> src;
  binary_fn<V> op;
  std::optional<V> acc;
};
} // namespace seqflow
