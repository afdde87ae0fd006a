#pragma once

#include <memory>
#include <utility>

#include "error.hpp"
#include "seq.hpp"

namespace seqflow {
/**
 * @brief Advance-checking harness
 *
 * Forwards to the wrapped sequence and verifies every try_advance() call: the sink must be invoked at most once, and
 * exactly when true is returned, and nothing may be produced after false was returned once. Any violation throws
 * contract_error into the caller.
 *
 * Not splittable, the harness checks one consumer.
 */
template <typename T>
class checked_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  explicit checked_seq(seq<T> src) : src(std::move(src)) { detail::require_source(this->src, "checked"); }

  bool try_advance(sink_type sink) override {
    bool called = false;
    bool const more = src.try_advance([&called, &sink](T &&v) {
      if (called) {
        throw contract_error("checked: sink invoked twice in one advance");
      }
      called = true;
      sink(std::move(v));
    });
    if (more && !called) {
      throw contract_error("checked: advance returned true without invoking the sink");
    }
    if (!more && called) {
      throw contract_error("checked: advance invoked the sink but returned false");
    }
    if (more && exhausted) {
      throw contract_error("checked: advance produced an element after reporting exhaustion");
    }
    if (!more) {
      exhausted = true;
    }
    return more;
  }

  size_t estimate_size() const noexcept override { return src.estimate_size(); }
  seq_props props() const noexcept override { return src.props(); }

  /// true once the wrapped sequence reported exhaustion
  bool is_exhausted() const noexcept { return exhausted; }

private:
  seq<T> src;
  bool exhausted{false};
};

template <typename T>
seq<T> checked(seq<T> src) {
  return make_seq<checked_seq<T>>(std::move(src));
}
} // namespace seqflow
