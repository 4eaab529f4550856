/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/SearchBound.h"

namespace Scine {
namespace Chemgraph {

constexpr std::size_t SearchBound::checkInterval;

SearchBound SearchBound::unbounded() {
  return SearchBound {};
}

SearchBound SearchBound::steps(const std::size_t n) {
  SearchBound bound;
  bound.maxSteps = n;
  return bound;
}

SearchBound SearchBound::until(const Clock::time_point t) {
  SearchBound bound;
  bound.deadline = t;
  return bound;
}

SearchBound SearchBound::within(const Clock::duration d) {
  SearchBound bound;
  bound.timeout = d;
  return bound;
}

bool SearchBound::isUnbounded() const {
  return !maxSteps && !deadline && !timeout && !cancelled;
}

SearchBound SearchBound::started() const {
  SearchBound bound = *this;
  if(timeout) {
    const Clock::time_point expiry = Clock::now() + timeout.value();
    if(!deadline || expiry < deadline.value()) {
      bound.deadline = expiry;
    }
    bound.timeout = boost::none;
  }
  return bound;
}

bool SearchBound::exceeded(const std::size_t stepsTaken) const {
  if(maxSteps && stepsTaken >= maxSteps.value()) {
    return true;
  }

  if(stepsTaken % checkInterval != 0) {
    return false;
  }

  if(deadline && Clock::now() >= deadline.value()) {
    return true;
  }

  return cancelled && cancelled();
}

} // namespace Chemgraph
} // namespace Scine
