#pragma once

#include <algorithm>
#include <functional>
#include <utility>

#include "../common.hpp"
#include "../detail/pull.hpp"

namespace seqflow {
/**
 * @brief Pairwise combination of two sources
 *
 * Pulls one element from each source and emits fn(a, b). Stops at the first exhausted source; the element already
 * pulled from `a` in that round is discarded.
 *
 * When R can be empty (pointer, optional, smart pointer), an empty result is a broken zipping function and throws
 * contract_error.
 */
template <typename A, typename B, typename R>
class zip_seq : public seq_base<R> {
public:
  using base = seq_base<R>;
  using typename base::sink_type;
  using fn_type = std::function<R(A const &, B const &)>;

  zip_seq(seq<A> a, seq<B> b, fn_type fn) : a(std::move(a)), b(std::move(b)), fn(std::move(fn)) {
    detail::require_ordered(this->a, "zip");
    detail::require_ordered(this->b, "zip");
    detail::require_callable(this->fn, "zip", "zipping function");
  }

  bool try_advance(sink_type sink) override {
    if (done) {
      return false;
    }
    auto x = detail::pull_one(a);
    if (!x) {
      done = true;
      return false;
    }
    auto y = detail::pull_one(b);
    if (!y) {
      done = true;
      return false;
    }
    R r = fn(*x, *y);
    if constexpr (nullable<R>) {
      if (!r) {
        throw contract_error("zip: zipping function returned an empty result");
      }
    }
    sink(std::move(r));
    return true;
  }

  size_t estimate_size() const noexcept override { return done ? 0 : std::min(a.estimate_size(), b.estimate_size()); }
  seq_props props() const noexcept override { return a.props().intersect(b.props()).structural(); }

private:
  seq<A> a;
  seq<B> b;
  fn_type fn;
  bool done{false};
};
} // namespace seqflow
