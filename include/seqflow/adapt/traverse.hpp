#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../detail/pull.hpp"
#include "../detail/utils_math.hpp"
#include "../source.hpp"

namespace seqflow {
namespace detail {
template <typename T>
std::vector<seq<T>> checked_sources(std::vector<seq<T>> srcs, char const *who) {
  if (srcs.size() < 2) {
    throw std::invalid_argument(std::string(who) + ": at least 2 sources are required");
  }
  for (auto const &src : srcs) {
    require_ordered(src, who);
  }
  return srcs;
}

template <typename T>
size_t min_estimate(std::vector<seq<T>> const &srcs) noexcept {
  size_t n = unbounded;
  for (auto const &src : srcs) {
    n = std::min(n, src.estimate_size());
  }
  return n;
}

template <typename T>
seq_props merged_props(std::vector<seq<T>> const &srcs) noexcept {
  std::vector<seq_props> all;
  all.reserve(srcs.size());
  for (auto const &src : srcs) {
    all.push_back(src.props());
  }
  return intersect_all(all).structural();
}
} // namespace detail

/**
 * @brief Lock-step bundles, one element from every source per emission
 *
 * Stops at the first exhausted source; elements already pulled for that round are discarded. If the very first round
 * finds an exhausted source, one empty bundle is emitted before stopping.
 */
template <typename T>
class traverse_seq : public seq_base<seq<T>> {
public:
  using base = seq_base<seq<T>>;
  using typename base::sink_type;

  explicit traverse_seq(std::vector<seq<T>> srcs) : srcs(detail::checked_sources(std::move(srcs), "traverse")) {}

  bool try_advance(sink_type sink) override {
    if (done) {
      return false;
    }
    bool const first = !started;
    started = true;

    std::vector<T> bundle;
    bundle.reserve(srcs.size());
    for (auto &src : srcs) {
      auto v = detail::pull_one(src);
      if (!v) {
        done = true;
        if (!first) {
          return false;
        }
        sink(empty<T>());
        return true;
      }
      bundle.push_back(std::move(*v));
    }
    sink(from_vector(std::move(bundle)));
    return true;
  }

  size_t estimate_size() const noexcept override {
    if (done) {
      return 0;
    }
    auto const n = detail::min_estimate(srcs);
    return started ? n : std::max<size_t>(n, 1);
  }

  seq_props props() const noexcept override { return detail::merged_props(srcs); }

private:
  std::vector<seq<T>> srcs;
  bool started{false};
  bool done{false};
};

/**
 * @brief Round-robin interleaving of several sources
 *
 * Pulls one element from every source per round and emits them in source order. A round cut short by an exhausted
 * source is discarded entirely.
 *
 * | sources              | output        |
 * |----------------------|---------------|
 * | [1,2,3] [4,5,6]      | 1 4 2 5 3 6   |
 * | [1,2,3] [4,5]        | 1 4 2 5       |
 */
template <typename T>
class weave_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  explicit weave_seq(std::vector<seq<T>> srcs) : srcs(detail::checked_sources(std::move(srcs), "weave")) {}

  bool try_advance(sink_type sink) override {
    if (round.empty() && !refill()) {
      return false;
    }
    sink(std::move(round.front()));
    round.pop_front();
    return true;
  }

  size_t estimate_size() const noexcept override {
    if (done) {
      return round.size();
    }
    return detail::sat_add(round.size(), detail::sat_mul(srcs.size(), detail::min_estimate(srcs)));
  }

  seq_props props() const noexcept override { return detail::merged_props(srcs); }

private:
  bool refill() {
    if (done) {
      return false;
    }
    for (auto &src : srcs) {
      auto v = detail::pull_one(src);
      if (!v) {
        done = true;
        round.clear();
        return false;
      }
      round.push_back(std::move(*v));
    }
    return true;
  }

  std::vector<seq<T>> srcs;
  std::deque<T> round;
  bool done{false};
};
} // namespace seqflow
