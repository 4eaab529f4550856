/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Department of Chemistry and Applied Biosciences, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Labeled simple graph wrapping a BGL adjacency list
 *
 * Storage of both molecules and groups. The graph has no chemistry semantics,
 * vertices and edges merely carry a label of a template parameter type.
 */

#ifndef INCLUDE_CHEMGRAPH_GRAPH_LABELED_GRAPH_H
#define INCLUDE_CHEMGRAPH_GRAPH_LABELED_GRAPH_H

#include "Chemgraph/GraphAlgorithms.h"
#include "Chemgraph/Error.h"
#include "Chemgraph/IteratorRange.h"
#include "Chemgraph/Types.h"

#include "boost/graph/adjacency_list.hpp"
#include "boost/optional.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace Scine {
namespace Chemgraph {

/**
 * @brief Simple undirected graph with labeled vertices and edges
 *
 * Vertices are identified by dense indices following insertion order. There
 * are no self-loops and at most one edge per unordered vertex pair, both of
 * which are checked on edge addition.
 *
 * @note Removing a vertex renumbers all vertices with a larger index down by
 *   one. Edge descriptors are invalidated by any structural modification and
 *   by copying the graph.
 *
 * @tparam VertexLabel Default-constructible label type of vertices
 * @tparam EdgeLabel Default-constructible label type of edges
 */
template<typename VertexLabel, typename EdgeLabel>
class LabeledGraph {
public:
//!@name Member types
//!@{
  //! Data class stored at each vertex
  struct VertexData {
    VertexLabel label;
  };

  //! Data class stored at each edge
  struct EdgeData {
    EdgeLabel label;
  };

  //! Vector storage of vertices and out-edges, so vertex descriptors are indices
  using BglType = boost::adjacency_list<
    boost::vecS,
    boost::vecS,
    boost::undirectedS,
    VertexData,
    EdgeData
  >;

  //! Vertex descriptor, equivalent to AtomIndex
  using Vertex = typename BglType::vertex_descriptor;
  //! Edge descriptor
  using Edge = typename BglType::edge_descriptor;

  using VertexRange = IteratorRange<typename BglType::vertex_iterator>;
  using EdgeRange = IteratorRange<typename BglType::edge_iterator>;
  using AdjacentVertexRange = IteratorRange<typename BglType::adjacency_iterator>;
  using IncidentEdgeRange = IteratorRange<typename BglType::out_edge_iterator>;
//!@}

//!@name Constructors
//!@{
  LabeledGraph() = default;
//!@}

//!@name Modifiers
//!@{
  /*! @brief Adds a vertex with a label
   *
   * @complexity{Amortized @math{\Theta(1)}}
   */
  Vertex addVertex(const VertexLabel& label) {
    const Vertex newVertex = boost::add_vertex(graph_);
    graph_[newVertex].label = label;
    return newVertex;
  }

  /*! @brief Adds an edge between two existing vertices
   *
   * @complexity{@math{O(\textrm{deg}(a))}}
   * @throws UnknownVertex If either vertex is not part of the graph
   * @throws SelfLoop If @p a and @p b are the same vertex
   * @throws DuplicateEdge If there is already an edge between the vertices
   */
  Edge addEdge(const Vertex a, const Vertex b, const EdgeLabel& label) {
    const Vertex size = V();
    if(a >= size || b >= size) {
      throw UnknownVertex(
        "Edge endpoint " + std::to_string(std::max(a, b))
        + " is not a vertex of a graph with " + std::to_string(size)
        + " vertices"
      );
    }

    if(a == b) {
      throw SelfLoop("Cannot add an edge from vertex " + std::to_string(a) + " to itself");
    }

    /* The out-edge list is a vector, not a set, so boost would happily add a
     * parallel edge.
     */
    if(boost::edge(a, b, graph_).second) {
      throw DuplicateEdge(
        "Vertices " + std::to_string(a) + " and " + std::to_string(b)
        + " are already joined by an edge"
      );
    }

    auto newEdgePair = boost::add_edge(a, b, graph_);
    graph_[newEdgePair.first].label = label;
    return newEdgePair.first;
  }

  /*! @brief Removes all edges incident to a vertex
   *
   * @throws std::out_of_range If the vertex does not exist
   */
  void clearVertex(const Vertex a) {
    throwIfInvalid_(a);
    boost::clear_vertex(a, graph_);
  }

  /*! @brief Removes a vertex and all edges incident to it
   *
   * Vertices with a larger index are renumbered down by one.
   *
   * @complexity{@math{O(V + E)}}
   * @throws std::out_of_range If the vertex does not exist
   */
  void removeVertex(const Vertex a) {
    throwIfInvalid_(a);
    boost::clear_vertex(a, graph_);
    boost::remove_vertex(a, graph_);
  }

  /*! @brief Removes the edge between two vertices
   *
   * @throws std::out_of_range If there is no such edge
   */
  void removeEdge(const Vertex a, const Vertex b) {
    boost::remove_edge(edge(a, b), graph_);
  }

  /*! @brief Mutable access to a vertex label
   *
   * @throws std::out_of_range If the vertex does not exist
   */
  VertexLabel& label(const Vertex a) {
    throwIfInvalid_(a);
    return graph_[a].label;
  }

  //! Mutable access to an edge label
  EdgeLabel& label(const Edge& e) {
    return graph_[e].label;
  }

  /*! @brief Copies another graph into this one as a disconnected part
   *
   * @returns The new indices of the other graph's vertices in this graph
   */
  std::vector<Vertex> merge(const LabeledGraph& other) {
    std::vector<Vertex> indices;
    indices.reserve(other.V());
    for(const Vertex v : other.vertices()) {
      indices.push_back(addVertex(other.label(v)));
    }

    for(const Edge& e : other.edges()) {
      addEdge(
        indices.at(other.source(e)),
        indices.at(other.target(e)),
        other.label(e)
      );
    }

    return indices;
  }
//!@}

//!@name Information
//!@{
  //! Number of vertices
  Vertex V() const {
    return boost::num_vertices(graph_);
  }

  //! Number of edges
  std::size_t E() const {
    return boost::num_edges(graph_);
  }

  /*! @brief Label of a vertex
   *
   * @throws std::out_of_range If the vertex does not exist
   */
  const VertexLabel& label(const Vertex a) const {
    throwIfInvalid_(a);
    return graph_[a].label;
  }

  //! Label of an edge
  const EdgeLabel& label(const Edge& e) const {
    return graph_[e].label;
  }

  //! Whether two vertices are joined by an edge
  bool adjacent(const Vertex a, const Vertex b) const {
    if(a >= V() || b >= V()) {
      return false;
    }

    return boost::edge(a, b, graph_).second;
  }

  /*! @brief Fetches the edge between two vertices
   *
   * @throws std::out_of_range If there is no such edge
   */
  Edge edge(const Vertex a, const Vertex b) const {
    const auto maybeEdge = edgeOption(a, b);
    if(!maybeEdge) {
      throw std::out_of_range("Specified edge does not exist in the graph");
    }

    return maybeEdge.value();
  }

  //! Fetches the edge between two vertices if it exists
  boost::optional<Edge> edgeOption(const Vertex a, const Vertex b) const {
    if(a >= V() || b >= V()) {
      return boost::none;
    }

    auto edgePair = boost::edge(a, b, graph_);
    if(edgePair.second) {
      return edgePair.first;
    }

    return boost::none;
  }

  //! Smaller vertex index of an edge
  Vertex source(const Edge& e) const {
    return std::min(boost::source(e, graph_), boost::target(e, graph_));
  }

  //! Larger vertex index of an edge
  Vertex target(const Edge& e) const {
    return std::max(boost::source(e, graph_), boost::target(e, graph_));
  }

  //! Ordered vertex pair of an edge
  BondIndex bondIndex(const Edge& e) const {
    return {boost::source(e, graph_), boost::target(e, graph_)};
  }

  /*! @brief Number of edges incident to a vertex
   *
   * @throws std::out_of_range If the vertex does not exist
   */
  unsigned degree(const Vertex a) const {
    throwIfInvalid_(a);
    return boost::out_degree(a, graph_);
  }

  /*! @brief Adjacent vertices in ascending index order
   *
   * @throws std::out_of_range If the vertex does not exist
   */
  std::vector<Vertex> neighbors(const Vertex a) const {
    throwIfInvalid_(a);
    std::vector<Vertex> adjacentVertices;
    adjacentVertices.reserve(boost::out_degree(a, graph_));
    for(const Vertex b : adjacents(a)) {
      adjacentVertices.push_back(b);
    }
    std::sort(std::begin(adjacentVertices), std::end(adjacentVertices));
    return adjacentVertices;
  }

  //! Connected components as ascending vertex lists, ordered by smallest member
  std::vector<std::vector<Vertex>> connectedComponents() const {
    return Chemgraph::connectedComponents(*this);
  }

  //! Whether the graph consists of a single connected component
  bool isConnected() const {
    return Chemgraph::numConnectedComponents(*this) <= 1;
  }

  /*! @brief Vertex-induced copy
   *
   * Vertex i of the copy corresponds to vertex vertices[i] of this graph.
   *
   * @throws std::out_of_range If any vertex does not exist
   * @throws InvalidInput If a vertex is listed twice
   */
  LabeledGraph subgraph(const std::vector<Vertex>& vertices) const {
    LabeledGraph copy;
    std::vector<boost::optional<Vertex>> newIndices(V());
    for(const Vertex v : vertices) {
      throwIfInvalid_(v);
      if(newIndices.at(v)) {
        throw InvalidInput("Vertex " + std::to_string(v) + " is listed more than once");
      }
      newIndices.at(v) = copy.addVertex(label(v));
    }

    for(const Edge& e : edges()) {
      const auto& s = newIndices.at(source(e));
      const auto& t = newIndices.at(target(e));
      if(s && t) {
        copy.addEdge(s.value(), t.value(), label(e));
      }
    }

    return copy;
  }

  /*! @brief Splits the graph into induced copies of its connected components
   *
   * Each copy is paired with the indices its vertices had in this graph.
   */
  std::vector<std::pair<LabeledGraph, std::vector<Vertex>>> split() const {
    std::vector<std::pair<LabeledGraph, std::vector<Vertex>>> components;
    for(auto& component : connectedComponents()) {
      LabeledGraph copy = subgraph(component);
      components.emplace_back(std::move(copy), std::move(component));
    }
    return components;
  }
//!@}

//!@name Ranges
//!@{
  VertexRange vertices() const {
    return makeRange(boost::vertices(graph_));
  }

  EdgeRange edges() const {
    return makeRange(boost::edges(graph_));
  }

  //! Adjacent vertices in edge insertion order
  AdjacentVertexRange adjacents(const Vertex a) const {
    return makeRange(boost::adjacent_vertices(a, graph_));
  }

  IncidentEdgeRange edges(const Vertex a) const {
    return makeRange(boost::out_edges(a, graph_));
  }
//!@}

  //! Underlying BGL graph
  const BglType& bgl() const {
    return graph_;
  }

private:
  void throwIfInvalid_(const Vertex a) const {
    if(a >= V()) {
      throw std::out_of_range(
        "Vertex index " + std::to_string(a) + " is out of range"
      );
    }
  }

  BglType graph_;
};

} // namespace Chemgraph
} // namespace Scine

#endif
