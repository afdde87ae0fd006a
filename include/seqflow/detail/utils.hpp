#pragma once

#include <span>
#include <vector>

namespace seqflow::detail {
template <typename T, typename A>
std::span<T const> as_span(std::vector<T, A> const &vec) noexcept {
  return {vec.data(), vec.size()};
}
} // namespace seqflow::detail
