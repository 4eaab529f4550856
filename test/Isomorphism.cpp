/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "boost/test/unit_test.hpp"

#include "Chemgraph/Graph/LabeledGraph.h"
#include "Chemgraph/Isomorphism.h"
#include "Chemgraph/IteratorRange.h"

#include "boost/graph/adjacency_list.hpp"

#include <chrono>
#include <system_error>
#include <thread>
#include <type_traits>

using namespace Scine;
using namespace Chemgraph;

namespace {

using TestGraph = LabeledGraph<unsigned, BondType>;

TestGraph complete(const unsigned n) {
  TestGraph graph;
  for(unsigned i = 0; i < n; ++i) {
    graph.addVertex(0);
  }
  for(unsigned i = 0; i < n; ++i) {
    for(unsigned j = i + 1; j < n; ++j) {
      graph.addEdge(i, j, BondType::Single);
    }
  }
  return graph;
}

TestGraph path(const unsigned n) {
  TestGraph graph;
  for(unsigned i = 0; i < n; ++i) {
    graph.addVertex(0);
  }
  for(unsigned i = 0; i + 1 < n; ++i) {
    graph.addEdge(i, i + 1, BondType::Single);
  }
  return graph;
}

TestGraph ring(const unsigned n) {
  TestGraph graph = path(n);
  graph.addEdge(n - 1, 0, BondType::Single);
  return graph;
}

/* Unchecked multigraph, for feeding graphs to the matcher that violate the
 * simple graph invariant
 */
struct Multigraph {
  using BglType = boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS>;
  using Edge = BglType::edge_descriptor;

  explicit Multigraph(const unsigned n) : graph(n) {}

  AtomIndex V() const { return boost::num_vertices(graph); }
  std::size_t E() const { return boost::num_edges(graph); }

  std::vector<AtomIndex> neighbors(const AtomIndex v) const {
    std::vector<AtomIndex> adjacents;
    for(const auto& e : makeRange(boost::out_edges(v, graph))) {
      adjacents.push_back(boost::target(e, graph));
    }
    std::sort(std::begin(adjacents), std::end(adjacents));
    return adjacents;
  }

  auto edges() const { return makeRange(boost::edges(graph)); }

  BondIndex bondIndex(const Edge& e) const {
    return {boost::source(e, graph), boost::target(e, graph)};
  }

  const BglType& bgl() const { return graph; }

  BglType graph;
};

const auto anyVertex = [](const AtomIndex /* s */, const AtomIndex /* t */) { return true; };
const auto anyEdge = [](const BondIndex& /* s */, const BondIndex& /* t */) { return true; };

} // namespace

BOOST_AUTO_TEST_CASE(MatcherStepping, *boost::unit_test::label("Chemgraph")) {
  const TestGraph hexagon = ring(6);
  auto matcher = Isomorphism::makeMatcher(
    hexagon, hexagon, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    SearchBound::unbounded()
  );

  unsigned found = 0;
  std::size_t previousSteps = 0;
  Isomorphism::Status status = Isomorphism::Status::Searching;
  while(status != Isomorphism::Status::Exhausted) {
    status = matcher.step();
    BOOST_REQUIRE(status != Isomorphism::Status::Aborted);
    // Each step tries at most one candidate
    BOOST_CHECK_LE(matcher.steps(), previousSteps + 1);
    previousSteps = matcher.steps();

    if(status == Isomorphism::Status::Found) {
      ++found;
      const IndexMap mapping = matcher.mapping();
      BOOST_CHECK_EQUAL(mapping.size(), 6);
      for(const auto& e : hexagon.edges()) {
        const BondIndex bond = hexagon.bondIndex(e);
        BOOST_CHECK(hexagon.adjacent(mapping.left.at(bond.first), mapping.left.at(bond.second)));
      }
    }
  }

  // Dihedral group of the hexagon
  BOOST_CHECK_EQUAL(found, 12);
  // Exhaustion is final
  BOOST_CHECK(matcher.step() == Isomorphism::Status::Exhausted);
}

BOOST_AUTO_TEST_CASE(MatcherModes, *boost::unit_test::label("Chemgraph")) {
  // Target edges without pattern counterpart are ignored in subgraph mode
  auto pathInTriangle = Isomorphism::makeMatcher(
    path(3), complete(3), anyVertex, anyEdge,
    Isomorphism::Mode::Subgraph,
    SearchBound::unbounded()
  );
  BOOST_CHECK_EQUAL(pathInTriangle.count().value(), 6);

  auto triangleInTetrahedron = Isomorphism::makeMatcher(
    complete(3), complete(4), anyVertex, anyEdge,
    Isomorphism::Mode::Subgraph,
    SearchBound::unbounded()
  );
  BOOST_CHECK_EQUAL(triangleInTetrahedron.count().value(), 24);

  // Non-adjacency must be preserved in exact mode
  auto exactPathTriangle = Isomorphism::makeMatcher(
    path(3), complete(3), anyVertex, anyEdge,
    Isomorphism::Mode::Exact,
    SearchBound::unbounded()
  );
  BOOST_CHECK(exactPathTriangle.rejectedWithoutSearch());
  BOOST_CHECK(!exactPathTriangle.findFirst().value());

  auto triangleInPath = Isomorphism::makeMatcher(
    complete(3), path(5), anyVertex, anyEdge,
    Isomorphism::Mode::Subgraph,
    SearchBound::unbounded()
  );
  BOOST_CHECK(triangleInPath.rejectedWithoutSearch());
  BOOST_CHECK_EQUAL(triangleInPath.count().value(), 0);

  // The empty pattern has exactly one, empty, embedding
  auto empty = Isomorphism::makeMatcher(
    TestGraph {}, ring(4), anyVertex, anyEdge,
    Isomorphism::Mode::Subgraph,
    SearchBound::unbounded()
  );
  const auto mappings = empty.findAll().value();
  BOOST_REQUIRE_EQUAL(mappings.size(), 1);
  BOOST_CHECK(mappings.front().empty());
}

BOOST_AUTO_TEST_CASE(MatcherComparators, *boost::unit_test::label("Chemgraph")) {
  TestGraph labeled = path(4);
  labeled.label(0) = 1;
  labeled.label(labeled.edge(2, 3)) = BondType::Double;

  const auto sameLabels = [&](const AtomIndex s, const AtomIndex t) {
    return labeled.label(s) == labeled.label(t);
  };
  const auto sameOrders = [&](const BondIndex& s, const BondIndex& t) {
    return (
      labeled.label(labeled.edge(s.first, s.second))
      == labeled.label(labeled.edge(t.first, t.second))
    );
  };

  // Distinct labels at both ends leave only the identity
  auto matcher = Isomorphism::makeMatcher(
    labeled, labeled, sameLabels, sameOrders,
    Isomorphism::Mode::Automorphism,
    SearchBound::unbounded()
  );
  const auto automorphisms = matcher.findAll().value();
  BOOST_REQUIRE_EQUAL(automorphisms.size(), 1);
  for(const auto& pair : automorphisms.front().left) {
    BOOST_CHECK_EQUAL(pair.first, pair.second);
  }

  // Without the edge comparator, the path reverses
  auto vertexOnly = Isomorphism::makeMatcher(
    path(4), path(4), anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    SearchBound::unbounded()
  );
  BOOST_CHECK_EQUAL(vertexOnly.count().value(), 2);
}

BOOST_AUTO_TEST_CASE(MatcherPins, *boost::unit_test::label("Chemgraph")) {
  const TestGraph hexagon = ring(6);
  auto fixed = Isomorphism::makeMatcher(
    hexagon, hexagon, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    SearchBound::unbounded(),
    {{0, 0}}
  );
  // Identity and the reflection through atom zero
  BOOST_CHECK_EQUAL(fixed.count().value(), 2);

  auto moved = Isomorphism::makeMatcher(
    hexagon, hexagon, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    SearchBound::unbounded(),
    {{0, 3}}
  );
  const auto mappings = moved.findAll().value();
  BOOST_CHECK_EQUAL(mappings.size(), 2);
  for(const auto& mapping : mappings) {
    BOOST_CHECK_EQUAL(mapping.left.at(0), 3);
  }

  BOOST_CHECK_THROW(
    Isomorphism::makeMatcher(
      hexagon, hexagon, anyVertex, anyEdge,
      Isomorphism::Mode::Automorphism,
      SearchBound::unbounded(),
      {{0, 6}}
    ),
    InvalidInput
  );
}

BOOST_AUTO_TEST_CASE(MatcherBounds, *boost::unit_test::label("Chemgraph")) {
  const TestGraph large = ring(12);

  auto noSteps = Isomorphism::makeMatcher(
    large, large, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    SearchBound::steps(0)
  );
  BOOST_CHECK(noSteps.step() == Isomorphism::Status::Aborted);
  BOOST_CHECK(noSteps.step() == Isomorphism::Status::Aborted);
  BOOST_CHECK_EQUAL(noSteps.steps(), 0);

  auto fewSteps = Isomorphism::makeMatcher(
    large, large, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    SearchBound::steps(20)
  );
  const auto limited = fewSteps.count();
  BOOST_REQUIRE(!limited);
  BOOST_CHECK(limited.error() == MatchError::SearchAborted);
  BOOST_CHECK_EQUAL(fewSteps.steps(), 20);

  SearchBound cancelled;
  cancelled.cancelled = []() { return true; };
  auto cancelledMatcher = Isomorphism::makeMatcher(
    large, large, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    cancelled
  );
  BOOST_CHECK(!cancelledMatcher.findFirst());

  auto expired = Isomorphism::makeMatcher(
    large, large, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    SearchBound::until(SearchBound::Clock::now() - std::chrono::seconds(1))
  );
  BOOST_CHECK(expired.findAll().error() == MatchError::SearchAborted);

  auto generous = Isomorphism::makeMatcher(
    large, large, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    SearchBound::within(std::chrono::hours(1))
  );
  BOOST_CHECK_EQUAL(generous.count().value(), 24);
}

BOOST_AUTO_TEST_CASE(AbortedSearchErrorCode, *boost::unit_test::label("Chemgraph")) {
  const TestGraph hexagon = ring(6);
  auto matcher = Isomorphism::makeMatcher(
    hexagon, hexagon, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    SearchBound::steps(0)
  );
  const auto result = matcher.findFirst();
  static_assert(
    std::is_same<std::decay_t<decltype(result.error())>, std::error_code>::value,
    "Search results carry standard error codes"
  );

  BOOST_REQUIRE(result.has_error());
  const std::error_code code = result.error();
  BOOST_CHECK(code == MatchError::SearchAborted);
  BOOST_CHECK(code.category() == matchErrorCategory());
  BOOST_CHECK_THROW(result.value(), std::system_error);
}

BOOST_AUTO_TEST_CASE(TimeoutsStartWithEachSearch, *boost::unit_test::label("Chemgraph")) {
  const TestGraph large = ring(12);
  const SearchBound timeout = SearchBound::within(std::chrono::milliseconds(20));
  BOOST_CHECK(!timeout.isUnbounded());
  BOOST_CHECK(!timeout.deadline);

  // Reusing the bound after its duration has passed once is fine
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  for(unsigned i = 0; i < 2; ++i) {
    auto matcher = Isomorphism::makeMatcher(
      large, large, anyVertex, anyEdge,
      Isomorphism::Mode::Automorphism,
      timeout
    );
    BOOST_CHECK_EQUAL(matcher.count().value(), 24);
  }

  const SearchBound started = timeout.started();
  BOOST_REQUIRE(started.deadline);
  BOOST_CHECK(!started.timeout);
  BOOST_CHECK(started.deadline.value() > SearchBound::Clock::now());

  // An earlier absolute deadline is kept
  SearchBound both = SearchBound::until(SearchBound::Clock::now() - std::chrono::seconds(1));
  both.timeout = SearchBound::Clock::duration {std::chrono::hours(1)};
  BOOST_CHECK(both.started().deadline == both.deadline);
  auto expired = Isomorphism::makeMatcher(
    large, large, anyVertex, anyEdge,
    Isomorphism::Mode::Automorphism,
    both
  );
  BOOST_CHECK(!expired.count());
}

BOOST_AUTO_TEST_CASE(MatcherRejectsMultigraphs, *boost::unit_test::label("Chemgraph")) {
  Multigraph parallel(2);
  boost::add_edge(0, 1, parallel.graph);
  boost::add_edge(1, 0, parallel.graph);

  BOOST_CHECK_THROW(
    Isomorphism::makeMatcher(
      parallel, parallel, anyVertex, anyEdge,
      Isomorphism::Mode::Exact,
      SearchBound::unbounded()
    ),
    InvalidInput
  );

  Multigraph loop(2);
  boost::add_edge(0, 1, loop.graph);
  boost::add_edge(1, 1, loop.graph);
  const TestGraph simple = path(2);

  BOOST_CHECK_THROW(
    Isomorphism::makeMatcher(
      simple, loop, anyVertex, anyEdge,
      Isomorphism::Mode::Subgraph,
      SearchBound::unbounded()
    ),
    InvalidInput
  );
}
