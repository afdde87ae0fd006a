#pragma once

#include <deque>
#include <memory>
#include <utility>
#include <vector>

#include "../common.hpp"
#include "../detail/pull.hpp"
#include "../detail/utils_math.hpp"

namespace seqflow {
enum class cross_policy {
  full,          ///< every ordered pair, self pairs included: N^2
  no_self_pairs, ///< every ordered pair of distinct positions: N(N-1)
  ordered,       ///< one pair per unordered couple, smaller first, equivalents skipped: N(N-1)/2
};

/**
 * @brief Incremental self-join of one source
 *
 * Each new element e is paired with the elements buffered so far, then appended to the buffer. The pairs formed for
 * e are queued and emitted one per try_advance().
 *
 * | policy        | pairs queued for e, per prior p, in encounter order        |
 * |---------------|------------------------------------------------------------|
 * | full          | (e, p) (p, e), then (e, e) once                            |
 * | no_self_pairs | (e, p) (p, e)                                              |
 * | ordered       | (p, e) if p < e, (e, p) if e < p, nothing if equivalent    |
 *
 * The buffer grows with the input. Never splits.
 */
template <typename T>
class cross_product_seq : public seq_base<std::pair<T, T>> {
public:
  using base = seq_base<std::pair<T, T>>;
  using typename base::sink_type;
  using pair_type = std::pair<T, T>;

  cross_product_seq(seq<T> src, cross_policy policy, less_fn<T> less = {})
      : src(std::move(src)), less(std::move(less)), policy(policy) {
    detail::require_ordered(this->src, name(policy));
    if (policy == cross_policy::ordered) {
      detail::require_callable(this->less, name(policy), "comparator");
    }
  }

  bool try_advance(sink_type sink) override {
    while (pending.empty()) {
      if (done) {
        return false;
      }
      auto e = detail::pull_one(src);
      if (!e) {
        done = true;
        return false;
      }
      pair_with_prior(*e);
      prior.push_back(std::move(*e));
    }
    sink(std::move(pending.front()));
    pending.pop_front();
    return true;
  }

  size_t estimate_size() const noexcept override {
    using namespace detail;
    if (done) {
      return pending.size();
    }
    // m future elements against b buffered ones
    auto const m = src.estimate_size();
    auto const b = prior.size();
    size_t future = 0;
    switch (policy) {
    case cross_policy::full:
      future = sat_add(sat_mul(2, sat_mul(b, m)), sat_mul(m, m));
      break;
    case cross_policy::no_self_pairs:
      future = sat_add(sat_mul(2, sat_mul(b, m)), sat_mul(m, sat_sub(m, 1)));
      break;
    case cross_policy::ordered:
      future = sat_add(sat_mul(b, m), sat_pairs(m));
      break;
    }
    return sat_add(pending.size(), future);
  }

  seq_props props() const noexcept override {
    auto const p = src.props();
    auto out = p.structural();
    if (policy == cross_policy::ordered) {
      out.sized = p.sized && p.distinct;
    }
    return out;
  }

private:
  static char const *name(cross_policy policy) noexcept {
    switch (policy) {
    case cross_policy::full:
      return "cross_product";
    case cross_policy::no_self_pairs:
      return "cross_product_no_self_pairs";
    case cross_policy::ordered:
      return "cross_product_ordered";
    }
    return "cross_product";
  }

  void pair_with_prior(T const &e) {
    for (auto const &p : prior) {
      if (policy != cross_policy::ordered) {
        pending.emplace_back(e, p);
        pending.emplace_back(p, e);
      } else if (less(p, e)) {
        pending.emplace_back(p, e);
      } else if (less(e, p)) {
        pending.emplace_back(e, p);
      }
    }
    if (policy == cross_policy::full) {
      pending.emplace_back(e, e);
    }
  }

  seq<T> src;
  less_fn<T> less;
  cross_policy const policy;
  std::vector<T> prior;
  std::deque<pair_type> pending;
  bool done{false};
};
} // namespace seqflow
