#pragma once

#include <cassert>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace seqflow::detail {
/**
 * @brief Fixed-capacity circular buffer backing the window adapters
 *
 * Capacity is allocated once (window width + 1) and never grows. Write and read cursors increase monotonically; the
 * slot of a cursor is `cursor % capacity`. The live region is [read, write), its length never exceeds the capacity.
 *
 * @tparam T element type, need not be default constructible
 */
template <typename T>
class window_buffer {
public:
  using value_type = T;
  using size_type = std::size_t;

  explicit window_buffer(size_type capacity) : slots(capacity), wcur(0), rcur(0) {
    assert(capacity > 0 && "[BUG] Window buffer with zero capacity.");
  }

  window_buffer(window_buffer const &) = delete;
  window_buffer &operator=(window_buffer const &) = delete;
  window_buffer(window_buffer &&) noexcept = default;
  window_buffer &operator=(window_buffer &&) noexcept = default;

  // push back at the write cursor
  template <typename U>
  void push(U &&value) {
    assert(size() < capacity() && "[BUG] Window buffer overrun.");
    slots[wcur % slots.size()] = std::forward<U>(value);
    ++wcur;
  }

  // drop n elements at the read cursor
  void pop(size_type n) noexcept {
    assert(n <= size() && "[BUG] Window buffer underrun.");
    for (size_type i = 0; i < n; ++i) {
      slots[(rcur + i) % slots.size()].reset();
    }
    rcur += n;
  }

  // idx-th live element, 0 = oldest
  T const &operator[](size_type idx) const {
    assert(idx < size() && "Index out of bounds");
    return *slots[(rcur + idx) % slots.size()];
  }

  // copy of the n oldest live elements
  std::vector<T> copy_front(size_type n) const {
    assert(n <= size() && "[BUG] Window larger than buffered data.");
    std::vector<T> out;
    out.reserve(n);
    for (size_type i = 0; i < n; ++i) {
      out.push_back(operator[](i));
    }
    return out;
  }

  size_type size() const noexcept { return wcur - rcur; }
  size_type capacity() const noexcept { return slots.size(); }
  bool empty() const noexcept { return wcur == rcur; }

  size_type write_cursor() const noexcept { return wcur; }
  size_type read_cursor() const noexcept { return rcur; }

private:
  std::vector<std::optional<T>> slots;
  size_type wcur;
  size_type rcur;
};
} // namespace seqflow::detail
