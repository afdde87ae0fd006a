#pragma once

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

namespace seqflow::detail {
/**
 * @brief Non-owning reference to an element sink
 *
 * Type-erased `void(T &&)` callable passed to try_advance(). Only valid for the duration of the call it is passed to,
 * which is the only way the library uses it.
 */
template <typename T>
class sink_ref {
  void *obj;
  void (*call)(void *, T &&);

public:
  template <typename F>
    requires(!std::same_as<std::remove_cvref_t<F>, sink_ref> && std::invocable<std::remove_reference_t<F> &, T &&>)
  sink_ref(F &&f) noexcept // NOLINT(google-explicit-constructor)
      : obj(const_cast<void *>(static_cast<void const *>(std::addressof(f)))),
        call([](void *o, T &&v) { (*static_cast<std::remove_reference_t<F> *>(o))(std::move(v)); }) {}

  sink_ref(sink_ref const &) noexcept = default;
  sink_ref &operator=(sink_ref const &) noexcept = default;

  void operator()(T &&v) const { call(obj, std::move(v)); }
  void operator()(T const &v) const
    requires std::copy_constructible<T>
  {
    T copy(v);
    call(obj, std::move(copy));
  }
};
} // namespace seqflow::detail
