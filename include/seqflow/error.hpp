#pragma once

#include <stdexcept>
#include <string>

namespace seqflow {
/**
 * @brief Broken single-step advance protocol.
 *
 * Thrown into whoever drives try_advance() when a sink is invoked twice, or when the returned flag disagrees with
 * whether the sink was invoked. This is a programming defect: the library never catches it.
 */
class contract_error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};
} // namespace seqflow
