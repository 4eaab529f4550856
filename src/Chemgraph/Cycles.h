/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Ring perception: smallest set of smallest rings
 */

#ifndef INCLUDE_CHEMGRAPH_CYCLES_H
#define INCLUDE_CHEMGRAPH_CYCLES_H

#include "Chemgraph/Types.h"

#include "boost/optional.hpp"

#include <stdexcept>
#include <vector>

namespace Scine {
namespace Chemgraph {
namespace Detail {

//! Ascending neighbor lists of each vertex
using Adjacency = std::vector<std::vector<AtomIndex>>;

/*! @brief Smallest set of smallest rings of a graph given as neighbor lists
 *
 * Each edge's shortest cycle is found by breadth-first search between its
 * endpoints with the edge itself excluded. Candidate cycles are sorted by
 * size, deduplicated and accepted if their edge sets are linearly independent
 * over GF(2) from the rings accepted so far. If the shortest cycles through
 * single edges do not span the cycle space, fundamental cycles of
 * breadth-first trees rooted at every vertex are added to the candidates and
 * selection is repeated.
 */
CHEMGRAPH_EXPORT std::vector<Ring> sssr(const Adjacency& adjacency);

template<class Graph>
Adjacency adjacency(const Graph& graph) {
  Adjacency lists;
  lists.reserve(graph.V());
  for(AtomIndex i = 0; i < graph.V(); ++i) {
    lists.push_back(graph.neighbors(i));
  }
  return lists;
}

} // namespace Detail

/*! @brief Smallest set of smallest rings of a graph
 *
 * Each ring is a vertex sequence in traversal order, rotated to start at its
 * smallest vertex index and oriented so that the second vertex is the smaller
 * of the first vertex's two ring neighbors. Rings are ordered by size, then
 * lexicographically. Exactly |E| - |V| + #components rings are returned.
 *
 * @complexity{@math{O(E^2 (V + E))} in the worst case}
 */
template<class Graph>
std::vector<Ring> sssr(const Graph& graph) {
  return Detail::sssr(Detail::adjacency(graph));
}

/**
 * @brief Ring information of a graph
 *
 * Computed in full on construction, not tied to the graph afterwards. Does
 * not follow any modification of the graph it was generated from.
 */
class CHEMGRAPH_EXPORT Cycles {
public:
  Cycles() = default;
  //! Perceive rings of a graph
  template<class Graph>
  explicit Cycles(const Graph& graph) : rings_(sssr(graph)) {}
  //! Wrap an existing ring set
  explicit Cycles(std::vector<Ring> rings);

  //! All rings of the smallest set of smallest rings
  const std::vector<Ring>& rings() const;
  //! Number of rings, equal to the cycle rank of the graph
  unsigned size() const;
  //! Whether there are no rings
  bool empty() const;

  //! Rings containing a vertex
  std::vector<Ring> containing(AtomIndex i) const;
  //! Rings containing an edge
  std::vector<Ring> containing(const BondIndex& bond) const;
  //! Size of the smallest ring containing a vertex, if any
  boost::optional<unsigned> smallestSizeContaining(AtomIndex i) const;

  std::vector<Ring>::const_iterator begin() const;
  std::vector<Ring>::const_iterator end() const;

private:
  std::vector<Ring> rings_;
};

/*! @brief Rings of the SSSR of a graph containing a particular vertex
 *
 * @throws std::out_of_range If the vertex does not exist
 */
template<class Graph>
std::vector<Ring> ringsContaining(const Graph& graph, const AtomIndex i) {
  if(i >= graph.V()) {
    throw std::out_of_range("Vertex index is out of range");
  }

  return Cycles(graph).containing(i);
}

/*! @brief Size of the smallest SSSR ring containing a vertex
 *
 * @throws std::out_of_range If the vertex does not exist
 * @returns None if the vertex is not part of any ring
 */
template<class Graph>
boost::optional<unsigned> smallestRingSize(const Graph& graph, const AtomIndex i) {
  if(i >= graph.V()) {
    throw std::out_of_range("Vertex index is out of range");
  }

  return Cycles(graph).smallestSizeContaining(i);
}

//! Whether a ring contains an edge, i.e. both atoms are consecutive in it
CHEMGRAPH_EXPORT bool ringContains(const Ring& ring, const BondIndex& bond);

} // namespace Chemgraph
} // namespace Scine

#endif
