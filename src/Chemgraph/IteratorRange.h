/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Department of Chemistry and Applied Biosciences, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Range type
 */

#ifndef INCLUDE_CHEMGRAPH_RANGE_H
#define INCLUDE_CHEMGRAPH_RANGE_H

#include <utility>

namespace Scine {
namespace Chemgraph {

/**
 * @brief Homogeneous pair of iterators with begin and end member fns
 * @tparam Iter Iterator type to store
 *
 * Wraps the iterator pairs returned by BGL's vertices, edges and
 * adjacent_vertices so that they are range-for compatible.
 */
template<typename Iter>
struct IteratorRange {
  Iter first;
  Iter second;

  IteratorRange() = default;
  IteratorRange(Iter a, Iter b) : first(std::move(a)), second(std::move(b)) {}
  explicit IteratorRange(std::pair<Iter, Iter> p) : first(std::move(p.first)), second(std::move(p.second)) {}

  inline Iter begin() const {
    return first;
  }

  inline Iter end() const {
    return second;
  }
};

template<typename Iter>
IteratorRange<Iter> makeRange(std::pair<Iter, Iter> p) {
  return IteratorRange<Iter> {std::move(p)};
}

} // namespace Chemgraph
} // namespace Scine

#endif
