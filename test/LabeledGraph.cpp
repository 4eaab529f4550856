/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "boost/test/unit_test.hpp"

#include "Chemgraph/Graph/LabeledGraph.h"
#include "Chemgraph/Temple/Functional.h"

using namespace Scine;
using namespace Chemgraph;

using TestGraph = LabeledGraph<unsigned, BondType>;

namespace {

TestGraph path(const unsigned n) {
  TestGraph graph;
  for(unsigned i = 0; i < n; ++i) {
    graph.addVertex(i);
  }
  for(unsigned i = 0; i + 1 < n; ++i) {
    graph.addEdge(i, i + 1, BondType::Single);
  }
  return graph;
}

} // namespace

BOOST_AUTO_TEST_CASE(LabeledGraphConstruction, *boost::unit_test::label("Chemgraph")) {
  TestGraph graph = path(4);
  BOOST_CHECK_EQUAL(graph.V(), 4);
  BOOST_CHECK_EQUAL(graph.E(), 3);
  BOOST_CHECK(graph.adjacent(1, 2));
  BOOST_CHECK(graph.adjacent(2, 1));
  BOOST_CHECK(!graph.adjacent(0, 2));
  BOOST_CHECK(!graph.adjacent(0, 17));
  BOOST_CHECK_EQUAL(graph.degree(1), 2);
  BOOST_CHECK_EQUAL(graph.label(3), 3);

  const auto e = graph.edge(2, 1);
  BOOST_CHECK(graph.bondIndex(e) == BondIndex(1, 2));
  BOOST_CHECK(graph.label(e) == BondType::Single);
  BOOST_CHECK(graph.edgeOption(0, 3) == boost::none);

  BOOST_CHECK_THROW(graph.addEdge(1, 0, BondType::Double), DuplicateEdge);
  BOOST_CHECK_THROW(graph.addEdge(1, 1, BondType::Double), SelfLoop);
  BOOST_CHECK_THROW(graph.addEdge(1, 4, BondType::Double), UnknownVertex);
  BOOST_CHECK_THROW(graph.removeEdge(0, 3), std::out_of_range);
  BOOST_CHECK_THROW(graph.label(4), std::out_of_range);

  // Failed insertions leave the graph unchanged
  BOOST_CHECK_EQUAL(graph.E(), 3);
}

BOOST_AUTO_TEST_CASE(LabeledGraphNeighborsSorted, *boost::unit_test::label("Chemgraph")) {
  TestGraph star;
  for(unsigned i = 0; i < 5; ++i) {
    star.addVertex(i);
  }
  star.addEdge(0, 4, BondType::Single);
  star.addEdge(0, 2, BondType::Single);
  star.addEdge(3, 0, BondType::Single);
  star.addEdge(1, 0, BondType::Single);

  const std::vector<AtomIndex> expected {1, 2, 3, 4};
  const auto neighbors = star.neighbors(0);
  BOOST_CHECK_EQUAL_COLLECTIONS(
    std::begin(neighbors), std::end(neighbors),
    std::begin(expected), std::end(expected)
  );
}

BOOST_AUTO_TEST_CASE(LabeledGraphRemoval, *boost::unit_test::label("Chemgraph")) {
  TestGraph graph = path(4);
  graph.removeEdge(1, 2);
  BOOST_CHECK_EQUAL(graph.E(), 2);
  BOOST_CHECK(!graph.isConnected());

  graph.addEdge(1, 2, BondType::Double);
  graph.clearVertex(1);
  BOOST_CHECK_EQUAL(graph.E(), 1);
  BOOST_CHECK_EQUAL(graph.V(), 4);

  // Removal renumbers later vertices down by one
  graph = path(4);
  graph.removeVertex(1);
  BOOST_CHECK_EQUAL(graph.V(), 3);
  BOOST_CHECK_EQUAL(graph.E(), 1);
  BOOST_CHECK_EQUAL(graph.label(1), 2);
  BOOST_CHECK(graph.adjacent(1, 2));
}

BOOST_AUTO_TEST_CASE(LabeledGraphComponents, *boost::unit_test::label("Chemgraph")) {
  TestGraph graph = path(3);
  const auto offsets = graph.merge(path(2));
  const std::vector<AtomIndex> expectedOffsets {3, 4};
  BOOST_CHECK(offsets == expectedOffsets);
  BOOST_CHECK_EQUAL(graph.V(), 5);
  BOOST_CHECK_EQUAL(graph.E(), 3);
  BOOST_CHECK(graph.adjacent(3, 4));
  BOOST_CHECK(!graph.isConnected());

  const auto components = graph.connectedComponents();
  BOOST_REQUIRE_EQUAL(components.size(), 2);
  BOOST_CHECK((components.front() == std::vector<AtomIndex> {0, 1, 2}));
  BOOST_CHECK((components.back() == std::vector<AtomIndex> {3, 4}));

  const auto parts = graph.split();
  BOOST_REQUIRE_EQUAL(parts.size(), 2);
  BOOST_CHECK_EQUAL(parts.front().first.V(), 3);
  BOOST_CHECK_EQUAL(parts.front().first.E(), 2);
  BOOST_CHECK_EQUAL(parts.back().first.V(), 2);
  BOOST_CHECK_EQUAL(parts.back().first.label(0), 0);
  BOOST_CHECK((parts.back().second == std::vector<AtomIndex> {3, 4}));
}

BOOST_AUTO_TEST_CASE(LabeledGraphInducedSubgraph, *boost::unit_test::label("Chemgraph")) {
  const TestGraph graph = path(5);
  const TestGraph induced = graph.subgraph({3, 2, 0});
  BOOST_CHECK_EQUAL(induced.V(), 3);
  BOOST_CHECK_EQUAL(induced.E(), 1);
  BOOST_CHECK_EQUAL(induced.label(0), 3);
  BOOST_CHECK(induced.adjacent(0, 1));
  BOOST_CHECK(!induced.adjacent(1, 2));

  BOOST_CHECK_THROW(graph.subgraph({1, 1}), InvalidInput);
  BOOST_CHECK_THROW(graph.subgraph({7}), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(LabeledGraphCopiesAreIndependent, *boost::unit_test::label("Chemgraph")) {
  const TestGraph original = path(3);
  TestGraph copy = original;
  copy.addEdge(0, 2, BondType::Triple);
  copy.label(0) = 10;

  BOOST_CHECK_EQUAL(original.E(), 2);
  BOOST_CHECK_EQUAL(original.label(0), 0);
  BOOST_CHECK_EQUAL(copy.E(), 3);
}
