#pragma once

#include <functional>
#include <memory>
#include <utility>

#include "../common.hpp"
#include "../def.hpp"
#include "../detail/pull.hpp"

namespace seqflow {
/**
 * @brief Element-wise transform selected by a validator
 *
 * Each element is mapped through `if_valid` when `validator` holds, through `if_invalid` otherwise. Splits exactly.
 */
template <typename T, typename R>
class validate_seq : public seq_base<R> {
public:
  using base = seq_base<R>;
  using typename base::sink_type;
  using fn_type = std::function<R(T const &)>;

  validate_seq(seq<T> src, pred_fn<T> validator, fn_type if_valid, fn_type if_invalid)
      : src(std::move(src)), validator(std::move(validator)), if_valid(std::move(if_valid)),
        if_invalid(std::move(if_invalid)) {
    detail::require_source(this->src, "validate");
    detail::require_callable(this->validator, "validate", "validator");
    detail::require_callable(this->if_valid, "validate", "valid function");
    detail::require_callable(this->if_invalid, "validate", "invalid function");
  }

  bool try_advance(sink_type sink) override {
    auto v = detail::pull_one(src);
    if (!v) {
      return false;
    }
    sink(validator(*v) ? if_valid(*v) : if_invalid(*v));
    return true;
  }

  std::unique_ptr<base> try_split() override {
    auto prefix = src.try_split();
    return prefix ? std::make_unique<validate_seq>(std::move(prefix), validator, if_valid, if_invalid) : nullptr;
  }

  SEQFLOW_SEQ_DEFAULTS(src.props().structural())

private:
  seq<T> src;
  pred_fn<T> validator;
  fn_type if_valid;
  fn_type if_invalid;
};
} // namespace seqflow
