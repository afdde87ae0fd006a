#pragma once

#include <concepts>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "error.hpp"
#include "seq_base.hpp"

namespace seqflow {
/**
 * @brief Owning handle to a pull-based sequence
 *
 * Move-only. A default constructed or moved-from handle is empty; adapters reject empty handles at construction.
 * try_split() returns an empty handle when the sequence cannot be split.
 */
template <typename T>
class seq {
public:
  using value_type = T;
  using base_type = seq_base<T>;
  using sink_type = typename base_type::sink_type;

  seq() noexcept = default;
  explicit seq(std::unique_ptr<base_type> impl) noexcept : impl(std::move(impl)) {}

  seq(seq &&) noexcept = default;
  seq &operator=(seq &&) noexcept = default;
  seq(seq const &) = delete;
  seq &operator=(seq const &) = delete;

  bool try_advance(sink_type sink) {
    if (!impl) {
      throw contract_error("seq: try_advance() on an empty sequence handle");
    }
    return impl->try_advance(sink);
  }

  seq try_split() {
    if (!impl) {
      return seq{};
    }
    return seq{impl->try_split()};
  }

  size_t estimate_size() const noexcept { return impl ? impl->estimate_size() : 0; }
  seq_props props() const noexcept { return impl ? impl->props() : seq_props{}; }

  explicit operator bool() const noexcept { return static_cast<bool>(impl); }

  base_type *get() const noexcept { return impl.get(); }

private:
  std::unique_ptr<base_type> impl;
};

template <typename S, typename... Args>
  requires std::derived_from<S, seq_base<typename S::value_type>>
seq<typename S::value_type> make_seq(Args &&...args) {
  return seq<typename S::value_type>{std::make_unique<S>(std::forward<Args>(args)...)};
}

namespace detail {
template <typename T>
void require_source(seq<T> const &src, char const *who) {
  if (!src) {
    throw std::invalid_argument(std::string(who) + ": source must not be empty");
  }
}

template <typename T>
void require_ordered(seq<T> const &src, char const *who) {
  require_source(src, who);
  if (!src.props().ordered) {
    throw std::invalid_argument(std::string(who) + ": source must be ordered");
  }
}

template <typename F>
void require_callable(F const &fn, char const *who, char const *what) {
  if (!fn) {
    throw std::invalid_argument(std::string(who) + ": " + what + " must not be empty");
  }
}
} // namespace detail
} // namespace seqflow
