#pragma once

#include <functional>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common.hpp"
#include "seq.hpp"

namespace seqflow {
/**
 * @brief Sequence over an owned vector
 *
 * Elements are moved out as they are advanced. Splits in halves at any point, the halves sharing the storage but
 * covering disjoint index ranges.
 */
template <typename T>
class vector_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  explicit vector_seq(std::vector<T> data, seq_props p = ordered_sized)
      : data(std::make_shared<std::vector<T>>(std::move(data))), lo(0), hi(this->data->size()), p(p) {
    this->p.sized = true;
  }

  vector_seq(std::shared_ptr<std::vector<T>> data, size_t lo, size_t hi, seq_props p) noexcept
      : data(std::move(data)), lo(lo), hi(hi), p(p) {}

  bool try_advance(sink_type sink) override {
    if (lo == hi) {
      return false;
    }
    sink(std::move((*data)[lo++]));
    return true;
  }

  std::unique_ptr<base> try_split() override {
    if (hi - lo < 2) {
      return nullptr;
    }
    auto const mid = lo + (hi - lo) / 2;
    auto prefix = std::make_unique<vector_seq>(data, lo, mid, p);
    lo = mid;
    return prefix;
  }

  size_t estimate_size() const noexcept override { return hi - lo; }
  seq_props props() const noexcept override { return p; }

private:
  std::shared_ptr<std::vector<T>> data;
  size_t lo;
  size_t hi;
  seq_props p;
};

/// Infinite arithmetic progression start, start + step, ...
template <arithmetic T>
class iota_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  explicit iota_seq(T start, T step = T{1}) noexcept : next(start), step(step) {}

  bool try_advance(sink_type sink) override {
    T cur = next;
    next += step;
    sink(std::move(cur));
    return true;
  }

  size_t estimate_size() const noexcept override { return unbounded; }
  seq_props props() const noexcept override {
    return {.ordered = true, .sized = false, .sorted = step > T{}, .distinct = step != T{}};
  }

private:
  T next;
  T const step;
};

/// Infinite sequence of gen() results
template <typename T>
class generate_seq : public seq_base<T> {
public:
  using base = seq_base<T>;
  using typename base::sink_type;

  explicit generate_seq(std::function<T()> gen) : gen(std::move(gen)) {
    detail::require_callable(this->gen, "generate", "generator");
  }

  bool try_advance(sink_type sink) override {
    sink(gen());
    return true;
  }

  size_t estimate_size() const noexcept override { return unbounded; }
  seq_props props() const noexcept override { return ordered_only; }

private:
  std::function<T()> gen;
};

// Factories

template <typename T>
seq<T> from_vector(std::vector<T> data, seq_props p = ordered_sized) {
  return make_seq<vector_seq<T>>(std::move(data), p);
}

template <typename T>
seq<T> of(std::initializer_list<T> init) {
  return from_vector(std::vector<T>(init));
}

template <typename T>
seq<T> empty() {
  return from_vector(std::vector<T>{});
}

template <arithmetic T>
seq<T> iota(T start, T step = T{1}) {
  return make_seq<iota_seq<T>>(start, step);
}

template <typename F>
  requires std::invocable<F &>
auto generate(F gen) {
  using T = std::decay_t<std::invoke_result_t<F &>>;
  return make_seq<generate_seq<T>>(std::function<T()>(std::move(gen)));
}
} // namespace seqflow
