/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Caller-supplied limits on backtracking searches
 */

#ifndef INCLUDE_CHEMGRAPH_SEARCH_BOUND_H
#define INCLUDE_CHEMGRAPH_SEARCH_BOUND_H

#include "Chemgraph/Export.h"

#include "boost/optional.hpp"

#include <chrono>
#include <functional>

namespace Scine {
namespace Chemgraph {

/**
 * @brief Limits placed on a single matching query
 *
 * Every candidate pairing tried by the isomorphism engine is one step. A
 * search whose bound is exceeded stops and reports MatchError::SearchAborted.
 * The step budget is checked before every step, the deadline and the
 * cancellation callback are checked every checkInterval steps.
 *
 * A timeout is relative to the start of each search, so a bound with a
 * timeout can be stored and reused for many queries. A deadline is an
 * absolute point in time and applies to every search using the bound.
 *
 * @code{.cpp}
 * auto bound = SearchBound::steps(1000);
 * bound.cancelled = [&]() { return stopRequested.load(); };
 * @endcode
 */
struct CHEMGRAPH_EXPORT SearchBound {
  using Clock = std::chrono::steady_clock;

  //! Number of steps between checks of deadline and cancellation callback
  static constexpr std::size_t checkInterval = 256;

  //! Maximum number of steps the search may take
  boost::optional<std::size_t> maxSteps;
  //! Point in time after which the search is abandoned
  boost::optional<Clock::time_point> deadline;
  //! Duration after the start of a search after which it is abandoned
  boost::optional<Clock::duration> timeout;
  //! Callback returning true if the search should be abandoned
  std::function<bool()> cancelled;

  //! No limits at all
  static SearchBound unbounded();
  //! Step budget only
  static SearchBound steps(std::size_t n);
  //! Deadline only
  static SearchBound until(Clock::time_point t);
  //! Timeout measured from the start of each search
  static SearchBound within(Clock::duration d);

  //! Whether no limits are set
  bool isUnbounded() const;

  /*! @brief Bound of a search starting now
   *
   * Merges the timeout into the deadline, keeping the earlier of the two.
   */
  SearchBound started() const;

  /*! @brief Whether a search that has taken @p stepsTaken steps may not
   *   take another step
   *
   * The timeout is not considered, call this on the started() bound.
   *
   * @complexity{@math{\Theta(1)}} plus the cost of the cancellation callback
   */
  bool exceeded(std::size_t stepsTaken) const;
};

} // namespace Chemgraph
} // namespace Scine

#endif
