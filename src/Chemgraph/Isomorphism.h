/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Backtracking engine for exact, subgraph and automorphism matching
 *
 * One state space search serves all three query types. The engine is
 * parameterized by vertex and edge compatibility predicates, so that exact
 * label equality, wildcard membership and group specialization are all
 * expressed by the caller.
 */

#ifndef INCLUDE_CHEMGRAPH_ISOMORPHISM_H
#define INCLUDE_CHEMGRAPH_ISOMORPHISM_H

#include "Chemgraph/Cycles.h"
#include "Chemgraph/Error.h"
#include "Chemgraph/GraphAlgorithms.h"
#include "Chemgraph/Log.h"
#include "Chemgraph/SearchBound.h"
#include "Chemgraph/Types.h"

#include "boost/dynamic_bitset.hpp"
#include "boost/optional.hpp"
#include "boost/outcome.hpp"
#include "boost/outcome/std_result.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace Scine {
namespace Chemgraph {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace Isomorphism {

//! Kind of mapping sought
enum class Mode {
  /*! Bijection between vertices preserving adjacency and non-adjacency, all
   * edges must correspond
   */
  Exact,
  /*! Injection of source (pattern) vertices into the target. Only edges
   * between mapped pattern vertices must be present in the target, further
   * target edges are ignored.
   */
  Subgraph,
  //! Exact matching of a graph onto itself
  Automorphism
};

//! Outcome of a single step of the search
enum class Status {
  //! The search continues
  Searching,
  //! A complete mapping has been found, see Matcher::mapping
  Found,
  //! The search space is exhausted, no further mappings exist
  Exhausted,
  //! The search bound was exceeded
  Aborted
};

//! Value of unmapped entries
constexpr AtomIndex unmapped = std::numeric_limits<AtomIndex>::max();

/**
 * @brief Explicit-stack backtracking search for graph mappings
 *
 * Source vertices are mapped one at a time in a static order. At each level,
 * candidates are drawn from the unmapped target neighbors of an already
 * mapped source neighbor's image where one exists, otherwise from all
 * compatible target vertices. Each candidate trial is one step of the search.
 *
 * Cheap invariants (compatibility under the vertex comparator, degree, ring
 * membership and optionally caller-supplied vertex colors) restrict the
 * candidates of each source vertex before the search and order the source
 * vertices, but never decide whether a mapping is valid. Validity is checked
 * against the edges of already mapped vertices.
 *
 * The search state lives entirely in the matcher, so step() may be called
 * repeatedly and interleaved with arbitrary caller logic.
 *
 * @tparam SourceGraph Graph type providing V(), E(), neighbors(v), degree(v),
 *   edges(), bondIndex(e), adjacent(a, b) and bgl()
 * @tparam TargetGraph As SourceGraph
 * @tparam VertexComparator Callable (AtomIndex source, AtomIndex target) -> bool
 * @tparam EdgeComparator Callable (BondIndex source, BondIndex target) -> bool
 */
template<
  class SourceGraph,
  class TargetGraph,
  class VertexComparator,
  class EdgeComparator
> class Matcher {
public:
  /*! @brief Prepares a search
   *
   * @param source Source or pattern graph
   * @param target Target graph
   * @param vertexComparator Whether a source vertex may map onto a target vertex
   * @param edgeComparator Whether a source edge may map onto a target edge
   * @param mode Kind of mapping sought
   * @param bound Limits on the search, a timeout counts from construction
   * @param pinned Pairs of source and target vertices that must map onto each
   *   other
   * @param sourceColors Optional vertex invariants of the source. Must be
   *   equal for vertices that may map onto each other. Ignored in Subgraph
   *   mode or if either color list is empty.
   * @param targetColors Optional vertex invariants of the target
   *
   * @throws InvalidInput If either graph has a self-loop or a parallel edge,
   *   if a pinned vertex does not exist, or if a color list has the wrong size
   */
  Matcher(
    const SourceGraph& source,
    const TargetGraph& target,
    VertexComparator vertexComparator,
    EdgeComparator edgeComparator,
    const Mode mode,
    SearchBound bound,
    const std::vector<std::pair<AtomIndex, AtomIndex>>& pinned = {},
    const std::vector<std::size_t>& sourceColors = {},
    const std::vector<std::size_t>& targetColors = {}
  ) : vertexComparator_(std::move(vertexComparator)),
      edgeComparator_(std::move(edgeComparator)),
      mode_(mode),
      bound_(bound.started()),
      sourceAdjacency_(adjacencyOf_(source, "Source")),
      targetAdjacency_(adjacencyOf_(target, "Target")),
      N_(source.V()),
      M_(target.V()),
      map_(N_, unmapped),
      inverse_(M_, unmapped)
  {
    if(sourceColors.size() != N_ && !sourceColors.empty()) {
      throw InvalidInput("Source colors do not match the number of source vertices");
    }

    if(targetColors.size() != M_ && !targetColors.empty()) {
      throw InvalidInput("Target colors do not match the number of target vertices");
    }

    for(const auto& pin : pinned) {
      if(pin.first >= N_ || pin.second >= M_) {
        throw InvalidInput(
          "Pinned pair (" + std::to_string(pin.first) + ", "
          + std::to_string(pin.second) + ") refers to vertices that do not exist"
        );
      }
    }

    targetMatrix_.assign(M_, boost::dynamic_bitset<>(M_));
    for(AtomIndex t = 0; t < M_; ++t) {
      for(const AtomIndex u : targetAdjacency_.at(t)) {
        targetMatrix_.at(t).set(u);
      }
    }

    const bool useColors = (
      mode_ != Mode::Subgraph
      && !sourceColors.empty()
      && !targetColors.empty()
    );

    impossible_ = quickReject_(source, target, useColors, sourceColors, targetColors);
    if(!impossible_) {
      populateCandidates_(source, target, pinned, useColors, sourceColors, targetColors);
    }

    if(!impossible_) {
      orderVertices_();
      if(N_ > 0) {
        frames_.push_back(makeFrame_(0));
      }
    }

    if(Log::isSet(Log::Particulars::IsomorphismSearch)) {
      auto& log = Log::log(Log::Particulars::IsomorphismSearch);
      log << "Matcher for " << N_ << " source and " << M_ << " target vertices";
      if(impossible_) {
        log << " rejected without search\n";
      } else {
        log << ", order:";
        for(const AtomIndex v : order_) {
          log << " " << v << " (" << candidates_.at(v).count() << ")";
        }
        log << "\n";
      }
    }
  }

//!@name Search
//!@{
  /*! @brief Performs a single step of the search
   *
   * Tries at most one candidate pairing. If a complete mapping is found, it
   * is available through mapping() until the next call.
   */
  Status step() {
    if(impossible_) {
      return Status::Exhausted;
    }

    if(aborted_) {
      return Status::Aborted;
    }

    // The empty source graph has exactly one mapping
    if(N_ == 0) {
      if(emptyReported_) {
        return Status::Exhausted;
      }

      emptyReported_ = true;
      return Status::Found;
    }

    if(frames_.empty()) {
      return Status::Exhausted;
    }

    Frame& frame = frames_.back();
    const AtomIndex v = order_.at(frames_.size() - 1);

    // Undo the previous trial at this level
    if(map_.at(v) != unmapped) {
      inverse_.at(map_.at(v)) = unmapped;
      map_.at(v) = unmapped;
    }

    if(frame.next == frame.candidates.size()) {
      frames_.pop_back();
      return frames_.empty() ? Status::Exhausted : Status::Searching;
    }

    if(bound_.exceeded(steps_)) {
      aborted_ = true;
      Log::log(Log::Level::Info) << "Matching search aborted after " << steps_ << " steps\n";
      return Status::Aborted;
    }

    const AtomIndex t = frame.candidates.at(frame.next);
    ++frame.next;
    ++steps_;

    if(inverse_.at(t) != unmapped || !feasible_(v, t)) {
      return Status::Searching;
    }

    map_.at(v) = t;
    inverse_.at(t) = v;

    if(frames_.size() == N_) {
      return Status::Found;
    }

    frames_.push_back(makeFrame_(frames_.size()));
    return Status::Searching;
  }

  /*! @brief Steps until the next complete mapping, exhaustion or abortion
   *
   * @returns Found, Exhausted or Aborted
   */
  Status next() {
    Status status = Status::Searching;
    while(status == Status::Searching) {
      status = step();
    }

    if(status != Status::Found) {
      Log::log(Log::Particulars::IsomorphismSearch)
        << "Search finished after " << steps_ << " steps\n";
    }

    return status;
  }

  //! Current mapping from source to target vertices. Complete after Found.
  IndexMap mapping() const {
    IndexMap map;
    for(AtomIndex v = 0; v < N_; ++v) {
      if(map_.at(v) != unmapped) {
        map.insert(IndexMap::value_type(v, map_.at(v)));
      }
    }
    return map;
  }

  //! Current mapping as flat vector indexed by source vertex
  const std::vector<AtomIndex>& flatMapping() const {
    return map_;
  }

  //! Number of candidate trials performed so far
  std::size_t steps() const {
    return steps_;
  }

  //! Whether the search was rejected before the first step
  bool rejectedWithoutSearch() const {
    return impossible_;
  }
//!@}

//!@name Drivers
//!@{
  //! First mapping found, if any
  outcome::std_result<boost::optional<IndexMap>> findFirst() {
    switch(next()) {
      case Status::Found: return boost::optional<IndexMap> {mapping()};
      case Status::Aborted: return MatchError::SearchAborted;
      default: return boost::optional<IndexMap> {};
    }
  }

  //! All remaining mappings
  outcome::std_result<std::vector<IndexMap>> findAll() {
    std::vector<IndexMap> mappings;
    auto result = forEach(
      [&](const std::vector<AtomIndex>& /* flat */) {
        mappings.push_back(mapping());
        return true;
      }
    );

    if(!result) {
      return result.error();
    }

    return mappings;
  }

  /*! @brief Calls a function with each remaining flat mapping
   *
   * @param f Callable (const std::vector<AtomIndex>&) -> bool. Returning false
   *   stops the enumeration early, which is not an error.
   */
  template<typename F>
  outcome::std_result<void> forEach(F&& f) {
    while(true) {
      switch(next()) {
        case Status::Found:
          if(!f(map_)) {
            return outcome::success();
          }
          break;
        case Status::Aborted:
          return MatchError::SearchAborted;
        default:
          return outcome::success();
      }
    }
  }

  //! Number of remaining mappings, without storing them
  outcome::std_result<std::size_t> count() {
    std::size_t found = 0;
    auto result = forEach(
      [&](const std::vector<AtomIndex>& /* flat */) {
        ++found;
        return true;
      }
    );

    if(!result) {
      return result.error();
    }

    return found;
  }
//!@}

private:
  //! Candidates of one level of the search and the position of the next trial
  struct Frame {
    std::vector<AtomIndex> candidates;
    std::size_t next;
  };

  template<class Graph>
  static Detail::Adjacency adjacencyOf_(const Graph& graph, const std::string& which) {
    Detail::Adjacency adjacency;
    adjacency.reserve(graph.V());
    for(AtomIndex v = 0; v < graph.V(); ++v) {
      std::vector<AtomIndex> neighbors = graph.neighbors(v);
      // Neighbor lists are sorted, so parallel edges are adjacent duplicates
      if(std::adjacent_find(std::begin(neighbors), std::end(neighbors)) != std::end(neighbors)) {
        throw InvalidInput(which + " graph has a parallel edge at vertex " + std::to_string(v));
      }
      if(std::binary_search(std::begin(neighbors), std::end(neighbors), v)) {
        throw InvalidInput(which + " graph has a self-loop at vertex " + std::to_string(v));
      }
      adjacency.push_back(std::move(neighbors));
    }
    return adjacency;
  }

  //! Checks that prove the absence of any mapping
  bool quickReject_(
    const SourceGraph& source,
    const TargetGraph& target,
    const bool useColors,
    const std::vector<std::size_t>& sourceColors,
    const std::vector<std::size_t>& targetColors
  ) const {
    if(mode_ == Mode::Subgraph) {
      return N_ > M_ || source.E() > target.E();
    }

    if(N_ != M_ || source.E() != target.E()) {
      return true;
    }

    auto degrees = [](const Detail::Adjacency& adjacency) {
      std::vector<std::size_t> sequence;
      sequence.reserve(adjacency.size());
      for(const auto& neighbors : adjacency) {
        sequence.push_back(neighbors.size());
      }
      std::sort(std::begin(sequence), std::end(sequence));
      return sequence;
    };

    if(degrees(sourceAdjacency_) != degrees(targetAdjacency_)) {
      return true;
    }

    if(useColors) {
      auto sortedSource = sourceColors;
      auto sortedTarget = targetColors;
      std::sort(std::begin(sortedSource), std::end(sortedSource));
      std::sort(std::begin(sortedTarget), std::end(sortedTarget));
      if(sortedSource != sortedTarget) {
        return true;
      }
    }

    return false;
  }

  void populateCandidates_(
    const SourceGraph& source,
    const TargetGraph& target,
    const std::vector<std::pair<AtomIndex, AtomIndex>>& pinned,
    const bool useColors,
    const std::vector<std::size_t>& sourceColors,
    const std::vector<std::size_t>& targetColors
  ) {
    const std::vector<bool> sourceCyclic = cyclicVertices(source);
    const std::vector<bool> targetCyclic = cyclicVertices(target);
    const bool exact = (mode_ != Mode::Subgraph);

    candidates_.assign(N_, boost::dynamic_bitset<>(M_));
    for(AtomIndex v = 0; v < N_; ++v) {
      const std::size_t vDegree = sourceAdjacency_.at(v).size();
      for(AtomIndex t = 0; t < M_; ++t) {
        const std::size_t tDegree = targetAdjacency_.at(t).size();
        const bool degreeFits = exact ? (vDegree == tDegree) : (vDegree <= tDegree);
        // In subgraph mode, a pattern ring atom can only map onto a ring atom
        const bool ringFits = exact
          ? (sourceCyclic.at(v) == targetCyclic.at(t))
          : (!sourceCyclic.at(v) || targetCyclic.at(t));
        const bool colorFits = !useColors || sourceColors.at(v) == targetColors.at(t);

        if(degreeFits && ringFits && colorFits && vertexComparator_(v, t)) {
          candidates_.at(v).set(t);
        }
      }
    }

    isPinned_.assign(N_, false);
    for(const auto& pin : pinned) {
      const bool allowed = candidates_.at(pin.first).test(pin.second);
      for(AtomIndex v = 0; v < N_; ++v) {
        candidates_.at(v).reset(pin.second);
      }
      candidates_.at(pin.first).reset();
      if(allowed) {
        candidates_.at(pin.first).set(pin.second);
      }
      isPinned_.at(pin.first) = true;
    }

    for(AtomIndex v = 0; v < N_; ++v) {
      if(candidates_.at(v).none()) {
        impossible_ = true;
        return;
      }
    }
  }

  /* Greedy static order: each next vertex maximizes the number of edges to
   * already ordered vertices, then prefers pinned vertices, fewer candidates,
   * larger degree and smaller index, in that order.
   */
  void orderVertices_() {
    std::vector<bool> ordered(N_, false);
    std::vector<unsigned> connections(N_, 0);
    std::vector<std::size_t> candidateCounts(N_);
    for(AtomIndex v = 0; v < N_; ++v) {
      candidateCounts.at(v) = candidates_.at(v).count();
    }

    order_.reserve(N_);
    parent_.assign(N_, unmapped);
    std::vector<std::size_t> position(N_, 0);

    auto key = [&](const AtomIndex v) {
      return std::make_tuple(
        connections.at(v),
        static_cast<bool>(isPinned_.at(v)),
        -static_cast<long long>(candidateCounts.at(v)),
        sourceAdjacency_.at(v).size(),
        -static_cast<long long>(v)
      );
    };

    for(std::size_t k = 0; k < N_; ++k) {
      AtomIndex best = unmapped;
      for(AtomIndex v = 0; v < N_; ++v) {
        if(!ordered.at(v) && (best == unmapped || key(best) < key(v))) {
          best = v;
        }
      }

      ordered.at(best) = true;
      position.at(best) = k;
      order_.push_back(best);

      for(const AtomIndex u : sourceAdjacency_.at(best)) {
        if(ordered.at(u)) {
          if(parent_.at(best) == unmapped || position.at(u) < position.at(parent_.at(best))) {
            parent_.at(best) = u;
          }
        } else {
          ++connections.at(u);
        }
      }
    }
  }

  Frame makeFrame_(const std::size_t depth) const {
    const AtomIndex v = order_.at(depth);
    const AtomIndex parent = parent_.at(v);
    Frame frame {{}, 0};

    if(parent != unmapped) {
      for(const AtomIndex t : targetAdjacency_.at(map_.at(parent))) {
        if(inverse_.at(t) == unmapped && candidates_.at(v).test(t)) {
          frame.candidates.push_back(t);
        }
      }
    } else {
      const auto& set = candidates_.at(v);
      for(auto t = set.find_first(); t != boost::dynamic_bitset<>::npos; t = set.find_next(t)) {
        if(inverse_.at(t) == unmapped) {
          frame.candidates.push_back(t);
        }
      }
    }

    return frame;
  }

  //! Whether mapping v onto t is consistent with all mapped vertices
  bool feasible_(const AtomIndex v, const AtomIndex t) const {
    std::size_t mappedSourceNeighbors = 0;
    for(const AtomIndex u : sourceAdjacency_.at(v)) {
      const AtomIndex image = map_.at(u);
      if(image == unmapped) {
        continue;
      }

      ++mappedSourceNeighbors;
      if(!targetMatrix_.at(t).test(image)) {
        return false;
      }

      if(!edgeComparator_(BondIndex {v, u}, BondIndex {t, image})) {
        return false;
      }
    }

    if(mode_ == Mode::Subgraph) {
      return true;
    }

    // Mapped non-neighbors of v must map onto non-neighbors of t
    std::size_t mappedTargetNeighbors = 0;
    for(const AtomIndex w : targetAdjacency_.at(t)) {
      if(inverse_.at(w) != unmapped) {
        ++mappedTargetNeighbors;
      }
    }

    return mappedSourceNeighbors == mappedTargetNeighbors;
  }

  VertexComparator vertexComparator_;
  EdgeComparator edgeComparator_;
  Mode mode_;
  SearchBound bound_;

  Detail::Adjacency sourceAdjacency_;
  Detail::Adjacency targetAdjacency_;
  std::vector<boost::dynamic_bitset<>> targetMatrix_;
  std::size_t N_;
  std::size_t M_;

  std::vector<boost::dynamic_bitset<>> candidates_;
  std::vector<bool> isPinned_;
  std::vector<AtomIndex> order_;
  std::vector<AtomIndex> parent_;

  std::vector<AtomIndex> map_;
  std::vector<AtomIndex> inverse_;
  std::vector<Frame> frames_;

  std::size_t steps_ = 0;
  bool impossible_ = false;
  bool aborted_ = false;
  bool emptyReported_ = false;
};

//! Type-deducing constructor helper
template<
  class SourceGraph,
  class TargetGraph,
  class VertexComparator,
  class EdgeComparator
> Matcher<SourceGraph, TargetGraph, VertexComparator, EdgeComparator> makeMatcher(
  const SourceGraph& source,
  const TargetGraph& target,
  VertexComparator vertexComparator,
  EdgeComparator edgeComparator,
  const Mode mode,
  SearchBound bound,
  const std::vector<std::pair<AtomIndex, AtomIndex>>& pinned = {},
  const std::vector<std::size_t>& sourceColors = {},
  const std::vector<std::size_t>& targetColors = {}
) {
  return {
    source,
    target,
    std::move(vertexComparator),
    std::move(edgeComparator),
    mode,
    std::move(bound),
    pinned,
    sourceColors,
    targetColors
  };
}

} // namespace Isomorphism
} // namespace Chemgraph
} // namespace Scine

#endif
