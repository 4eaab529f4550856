/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Connectivity, traversal and ring bond algorithms on labeled graphs
 *
 * All algorithms are templates on the graph type. They require V(),
 * neighbors(v), edges(), bondIndex(e) and bgl() and are therefore usable with
 * any LabeledGraph instantiation as well as the Molecule and Group classes.
 * No results are cached, each call recomputes from the graph.
 */

#ifndef INCLUDE_CHEMGRAPH_GRAPH_ALGORITHMS_H
#define INCLUDE_CHEMGRAPH_GRAPH_ALGORITHMS_H

#include "Chemgraph/Types.h"

#include "boost/graph/biconnected_components.hpp"
#include "boost/graph/breadth_first_search.hpp"
#include "boost/graph/connected_components.hpp"
#include "boost/property_map/property_map.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <map>
#include <queue>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace Scine {
namespace Chemgraph {
namespace Detail {

template<class Graph>
void throwIfInvalidVertex(const Graph& graph, const AtomIndex a) {
  if(a >= graph.V()) {
    throw std::out_of_range(
      "Vertex index " + std::to_string(a) + " is out of range"
    );
  }
}

} // namespace Detail

/*! @brief Number of connected components of a graph
 *
 * @complexity{@math{O(V + E)}}
 */
template<class Graph>
unsigned numConnectedComponents(const Graph& graph) {
  if(graph.V() == 0) {
    return 0;
  }

  std::vector<unsigned> componentMap(graph.V());
  return boost::connected_components(graph.bgl(), &componentMap[0]);
}

/*! @brief Component index of each vertex
 *
 * @complexity{@math{O(V + E)}}
 * @returns The number of components and a component index for each vertex
 */
template<class Graph>
std::pair<unsigned, std::vector<unsigned>> componentMap(const Graph& graph) {
  std::vector<unsigned> components(graph.V());
  if(graph.V() == 0) {
    return {0, components};
  }

  const unsigned count = boost::connected_components(graph.bgl(), &components[0]);
  return {count, std::move(components)};
}

/*! @brief Connected components as ascending vertex lists
 *
 * Components are ordered by their smallest vertex, so that the result does
 * not depend on the component numbering of boost.
 *
 * @complexity{@math{O(V \log V + E)}}
 */
template<class Graph>
std::vector<std::vector<AtomIndex>> connectedComponents(const Graph& graph) {
  const auto countAndMap = componentMap(graph);
  std::vector<std::vector<AtomIndex>> components(countAndMap.first);
  const AtomIndex size = graph.V();
  for(AtomIndex i = 0; i < size; ++i) {
    components.at(countAndMap.second.at(i)).push_back(i);
  }

  std::sort(
    std::begin(components),
    std::end(components),
    [](const auto& a, const auto& b) { return a.front() < b.front(); }
  );
  return components;
}

/*! @brief Breadth-first visiting order of the component containing a vertex
 *
 * Neighbors are visited in ascending index order, so that equal graphs yield
 * identical sequences.
 *
 * @complexity{@math{O(V \log V + E)}}
 * @throws std::out_of_range If @p start is not a vertex of the graph
 */
template<class Graph>
std::vector<AtomIndex> breadthFirstOrder(const Graph& graph, const AtomIndex start) {
  Detail::throwIfInvalidVertex(graph, start);

  std::vector<bool> discovered(graph.V(), false);
  std::vector<AtomIndex> order;
  std::queue<AtomIndex> queue;
  queue.push(start);
  discovered.at(start) = true;

  while(!queue.empty()) {
    const AtomIndex v = queue.front();
    queue.pop();
    order.push_back(v);
    for(const AtomIndex w : graph.neighbors(v)) {
      if(!discovered.at(w)) {
        discovered.at(w) = true;
        queue.push(w);
      }
    }
  }

  return order;
}

/*! @brief Depth-first (pre-order) visiting order of the component containing
 *   a vertex
 *
 * Neighbors are descended into in ascending index order. The traversal keeps
 * an explicit stack, so long chains do not exhaust the call stack.
 *
 * @complexity{@math{O(V \log V + E)}}
 * @throws std::out_of_range If @p start is not a vertex of the graph
 */
template<class Graph>
std::vector<AtomIndex> depthFirstOrder(const Graph& graph, const AtomIndex start) {
  Detail::throwIfInvalidVertex(graph, start);

  // Vertex and its sorted neighbors with the position of the next to descend into
  struct Frame {
    std::vector<AtomIndex> neighbors;
    unsigned next;
  };

  std::vector<bool> discovered(graph.V(), false);
  std::vector<AtomIndex> order {start};
  std::vector<Frame> stack {Frame {graph.neighbors(start), 0}};
  discovered.at(start) = true;

  while(!stack.empty()) {
    Frame& frame = stack.back();
    if(frame.next == frame.neighbors.size()) {
      stack.pop_back();
      continue;
    }

    const AtomIndex w = frame.neighbors.at(frame.next);
    ++frame.next;
    if(!discovered.at(w)) {
      discovered.at(w) = true;
      order.push_back(w);
      stack.push_back(Frame {graph.neighbors(w), 0});
    }
  }

  return order;
}

//! Value marking vertices unreachable from the source of a search
constexpr unsigned unreachable = std::numeric_limits<unsigned>::max();

/*! @brief Calculates the graph distance from a single vertex to all others
 *
 * Performs a BFS through the graph starting at the supplied index and
 * records the distance of vertices it encounters.
 *
 * @complexity{@math{O(V + E)}}
 * @throws std::out_of_range If source >= V()
 *
 * @returns The distance of each vertex from @p source. Vertices in other
 *   components have distance @p unreachable.
 */
template<class Graph>
std::vector<unsigned> distance(const Graph& graph, const AtomIndex source) {
  Detail::throwIfInvalidVertex(graph, source);

  std::vector<unsigned> distances(graph.V(), unreachable);
  distances.at(source) = 0;

  boost::breadth_first_search(
    graph.bgl(),
    source,
    boost::visitor(
      boost::make_bfs_visitor(
        boost::record_distances(&distances[0], boost::on_tree_edge {})
      )
    )
  );

  return distances;
}

//! Flat predecessor map of a breadth-first search tree
struct PredecessorMap {
  //! Source vertex of the search
  AtomIndex source;
  //! Predecessor of each vertex. The source and unreachable vertices are their own predecessors.
  std::vector<AtomIndex> predecessors;

  /**
   * @brief Generate path from source to target vertex
   *
   * @param target Target vertex of shortest path
   *
   * @return Path starting at source and ending at target, including both
   *   source and target vertices. Empty if target is unreachable.
   */
  std::vector<AtomIndex> path(AtomIndex target) const {
    std::vector<AtomIndex> vertices {target};
    while(target != source) {
      const AtomIndex predecessor = predecessors.at(target);
      if(predecessor == target) {
        return {};
      }
      target = predecessor;
      vertices.push_back(target);
    }

    std::reverse(std::begin(vertices), std::end(vertices));
    return vertices;
  }
};

/**
 * @brief Generates shortest paths to each vertex in a graph
 *
 * @param graph Graph containing the vertex
 * @param source Vertex to start at
 *
 * @complexity{@math{O(V + E)}}
 * @throws std::out_of_range If source >= V()
 */
template<class Graph>
PredecessorMap shortestPaths(const Graph& graph, const AtomIndex source) {
  Detail::throwIfInvalidVertex(graph, source);

  PredecessorMap map;
  map.source = source;
  map.predecessors.resize(graph.V());
  for(AtomIndex i = 0; i < graph.V(); ++i) {
    map.predecessors.at(i) = i;
  }

  boost::breadth_first_search(
    graph.bgl(),
    source,
    boost::visitor(
      boost::make_bfs_visitor(
        boost::record_predecessors(&map.predecessors[0], boost::on_tree_edge {})
      )
    )
  );

  return map;
}

//! Articulation vertices and bridge edges of a graph
struct RingBondData {
  //! Vertices whose removal increases the number of connected components
  std::set<AtomIndex> articulationVertices;
  //! Edges whose removal increases the number of connected components
  std::set<BondIndex> bridges;
};

/*! @brief Finds articulation vertices and bridges
 *
 * An edge is a bridge if its biconnected component contains only that edge.
 * Non-bridge edges are exactly the edges that are part of a cycle.
 *
 * @complexity{@math{O(V + E \log E)}}
 */
template<class Graph>
RingBondData ringBondData(const Graph& graph) {
  using Edge = typename Graph::Edge;

  RingBondData data;
  if(graph.V() == 0) {
    return data;
  }

  std::vector<AtomIndex> articulationVertices;

  using ComponentMapBase = std::map<Edge, std::size_t>;

  ComponentMapBase componentMapData;
  boost::associative_property_map<ComponentMapBase> componentMap(componentMapData);
  std::size_t numComponents;

  // Calculate the biconnected components and articulation vertices
  std::tie(numComponents, std::ignore) = boost::biconnected_components(
    graph.bgl(),
    componentMap,
    std::back_inserter(articulationVertices)
  );

  data.articulationVertices.insert(
    std::begin(articulationVertices),
    std::end(articulationVertices)
  );

  std::vector<std::vector<BondIndex>> componentEdges(numComponents);
  for(const auto& mapIterPair : componentMapData) {
    componentEdges.at(mapIterPair.second).push_back(
      graph.bondIndex(mapIterPair.first)
    );
  }

  for(const auto& component : componentEdges) {
    if(component.size() == 1) {
      data.bridges.insert(component.front());
    }
  }

  return data;
}

//! Ascending list of articulation (cut) vertices
template<class Graph>
std::vector<AtomIndex> articulationVertices(const Graph& graph) {
  const auto data = ringBondData(graph);
  return {
    std::begin(data.articulationVertices),
    std::end(data.articulationVertices)
  };
}

//! Ascending list of bridge edges
template<class Graph>
std::vector<BondIndex> bridges(const Graph& graph) {
  const auto data = ringBondData(graph);
  return {
    std::begin(data.bridges),
    std::end(data.bridges)
  };
}

/*! @brief Whether an edge lies on a cycle, i.e. is not a bridge
 *
 * @throws std::out_of_range If there is no edge between @p a and @p b
 */
template<class Graph>
bool isEdgeInCycle(const Graph& graph, const AtomIndex a, const AtomIndex b) {
  if(!graph.adjacent(a, b)) {
    throw std::out_of_range("Specified edge does not exist in the graph");
  }

  return ringBondData(graph).bridges.count(BondIndex {a, b}) == 0;
}

/*! @brief Whether a vertex lies on a cycle, i.e. touches a non-bridge edge
 *
 * @throws std::out_of_range If the vertex does not exist
 */
template<class Graph>
bool isVertexInCycle(const Graph& graph, const AtomIndex a) {
  Detail::throwIfInvalidVertex(graph, a);
  const auto data = ringBondData(graph);
  for(const AtomIndex b : graph.neighbors(a)) {
    if(data.bridges.count(BondIndex {a, b}) == 0) {
      return true;
    }
  }
  return false;
}

//! For each vertex, whether it lies on a cycle
template<class Graph>
std::vector<bool> cyclicVertices(const Graph& graph) {
  std::vector<bool> cyclic(graph.V(), false);
  const auto data = ringBondData(graph);
  for(const auto& e : graph.edges()) {
    const BondIndex bond = graph.bondIndex(e);
    if(data.bridges.count(bond) == 0) {
      cyclic.at(bond.first) = true;
      cyclic.at(bond.second) = true;
    }
  }
  return cyclic;
}

/*! @brief Dimension of the cycle space, |E| - |V| + #components
 *
 * @complexity{@math{O(V + E)}}
 */
template<class Graph>
unsigned cycleRank(const Graph& graph) {
  return graph.E() + numConnectedComponents(graph) - graph.V();
}

//! Whether the graph contains any cycle
template<class Graph>
bool isCyclic(const Graph& graph) {
  return cycleRank(graph) > 0;
}

} // namespace Chemgraph
} // namespace Scine

#endif
