/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/Cycles.h"

#include "Chemgraph/Log.h"
#include "Chemgraph/Temple/Functional.h"

#include "boost/dynamic_bitset.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <map>
#include <queue>
#include <stdexcept>
#include <tuple>

namespace Scine {
namespace Chemgraph {
namespace {

constexpr AtomIndex unvisited = std::numeric_limits<AtomIndex>::max();

using EdgeSet = boost::dynamic_bitset<>;

//! Dense numbering of the edges of a graph given as neighbor lists
struct EdgeIndices {
  explicit EdgeIndices(const Detail::Adjacency& adjacency) {
    const AtomIndex size = adjacency.size();
    for(AtomIndex a = 0; a < size; ++a) {
      for(const AtomIndex b : adjacency.at(a)) {
        if(a < b) {
          indices.emplace(BondIndex {a, b}, bonds.size());
          bonds.emplace_back(a, b);
        }
      }
    }
  }

  std::size_t at(const AtomIndex a, const AtomIndex b) const {
    return indices.at(BondIndex {a, b});
  }

  std::map<BondIndex, std::size_t> indices;
  std::vector<BondIndex> bonds;
};

struct Candidate {
  Ring ring;
  EdgeSet edges;

  bool operator < (const Candidate& other) const {
    return std::make_tuple(ring.size(), std::cref(ring))
      < std::make_tuple(other.ring.size(), std::cref(other.ring));
  }

  bool operator == (const Candidate& other) const {
    return ring == other.ring;
  }
};

//! Row echelon basis of GF(2) edge incidence vectors
class CycleBasis {
public:
  //! Adds a vector if it is independent from all vectors in the basis
  bool tryAdd(EdgeSet vector) {
    while(true) {
      const auto pivot = vector.find_first();
      if(pivot == EdgeSet::npos) {
        return false;
      }

      const auto findIter = rows_.find(pivot);
      if(findIter == std::end(rows_)) {
        rows_.emplace(pivot, std::move(vector));
        return true;
      }

      // Clears the pivot bit, only bits of larger index change
      vector ^= findIter->second;
    }
  }

  std::size_t size() const {
    return rows_.size();
  }

private:
  std::map<std::size_t, EdgeSet> rows_;
};

/*! Rotate to the smallest index, orient towards the smaller of its two ring
 * neighbors
 */
Ring canonicalize(Ring ring) {
  std::rotate(
    std::begin(ring),
    std::min_element(std::begin(ring), std::end(ring)),
    std::end(ring)
  );

  if(ring.size() > 2 && ring.back() < ring.at(1)) {
    std::reverse(std::begin(ring) + 1, std::end(ring));
  }

  return ring;
}

Candidate makeCandidate(Ring ring, const EdgeIndices& edgeIndices) {
  Candidate candidate;
  candidate.ring = canonicalize(std::move(ring));
  candidate.edges.resize(edgeIndices.bonds.size());
  const unsigned size = candidate.ring.size();
  for(unsigned i = 0; i < size; ++i) {
    candidate.edges.set(
      edgeIndices.at(candidate.ring.at(i), candidate.ring.at((i + 1) % size))
    );
  }
  return candidate;
}

//! Shortest cycle through the edge a-b, found by BFS from a to b without the edge
boost::optional<Ring> shortestCycleThrough(
  const Detail::Adjacency& adjacency,
  const AtomIndex a,
  const AtomIndex b
) {
  std::vector<AtomIndex> predecessors(adjacency.size(), unvisited);
  std::queue<AtomIndex> queue;
  predecessors.at(a) = a;
  queue.push(a);

  while(!queue.empty()) {
    const AtomIndex v = queue.front();
    queue.pop();
    for(const AtomIndex w : adjacency.at(v)) {
      if((v == a && w == b) || predecessors.at(w) != unvisited) {
        continue;
      }

      predecessors.at(w) = v;
      if(w == b) {
        Ring ring {b};
        for(AtomIndex u = b; u != a; ) {
          u = predecessors.at(u);
          ring.push_back(u);
        }
        return ring;
      }
      queue.push(w);
    }
  }

  return boost::none;
}

//! Cycles closed by non-tree edges of a BFS tree rooted at a vertex
std::vector<Ring> fundamentalCycles(
  const Detail::Adjacency& adjacency,
  const AtomIndex root
) {
  std::vector<AtomIndex> predecessors(adjacency.size(), unvisited);
  std::vector<unsigned> depths(adjacency.size(), 0);
  std::vector<AtomIndex> order;
  std::queue<AtomIndex> queue;
  predecessors.at(root) = root;
  queue.push(root);

  while(!queue.empty()) {
    const AtomIndex v = queue.front();
    queue.pop();
    order.push_back(v);
    for(const AtomIndex w : adjacency.at(v)) {
      if(predecessors.at(w) == unvisited) {
        predecessors.at(w) = v;
        depths.at(w) = depths.at(v) + 1;
        queue.push(w);
      }
    }
  }

  std::vector<Ring> cycles;
  for(const AtomIndex x : order) {
    for(const AtomIndex y : adjacency.at(x)) {
      if(y < x || predecessors.at(y) == x || predecessors.at(x) == y) {
        continue;
      }

      // Climb to the lowest common ancestor of x and y
      std::vector<AtomIndex> left {x};
      std::vector<AtomIndex> right {y};
      AtomIndex u = x;
      AtomIndex w = y;
      while(u != w) {
        if(depths.at(u) >= depths.at(w)) {
          u = predecessors.at(u);
          left.push_back(u);
        } else {
          w = predecessors.at(w);
          right.push_back(w);
        }
      }

      right.pop_back();
      left.insert(std::end(left), right.rbegin(), right.rend());
      cycles.push_back(std::move(left));
    }
  }

  return cycles;
}

unsigned countComponents(const Detail::Adjacency& adjacency) {
  std::vector<bool> visited(adjacency.size(), false);
  unsigned count = 0;
  for(AtomIndex i = 0; i < adjacency.size(); ++i) {
    if(visited.at(i)) {
      continue;
    }

    ++count;
    std::queue<AtomIndex> queue;
    visited.at(i) = true;
    queue.push(i);
    while(!queue.empty()) {
      const AtomIndex v = queue.front();
      queue.pop();
      for(const AtomIndex w : adjacency.at(v)) {
        if(!visited.at(w)) {
          visited.at(w) = true;
          queue.push(w);
        }
      }
    }
  }
  return count;
}

std::vector<Ring> select(std::vector<Candidate> candidates, const unsigned rank) {
  Temple::sortUnique(candidates);

  CycleBasis basis;
  std::vector<Ring> accepted;
  for(auto& candidate : candidates) {
    if(accepted.size() == rank) {
      break;
    }

    if(basis.tryAdd(candidate.edges)) {
      Log::log(Log::Particulars::RingPerception)
        << "Accepted ring of size " << candidate.ring.size() << "\n";
      accepted.push_back(std::move(candidate.ring));
    }
  }

  return accepted;
}

} // namespace

namespace Detail {

std::vector<Ring> sssr(const Adjacency& adjacency) {
  const EdgeIndices edgeIndices {adjacency};
  const unsigned V = adjacency.size();
  const unsigned E = edgeIndices.bonds.size();
  const unsigned rank = E + countComponents(adjacency) - V;

  if(rank == 0) {
    return {};
  }

  std::vector<Candidate> candidates;
  for(const BondIndex& bond : edgeIndices.bonds) {
    if(auto ringOption = shortestCycleThrough(adjacency, bond.first, bond.second)) {
      candidates.push_back(makeCandidate(std::move(ringOption.value()), edgeIndices));
    }
  }

  Log::log(Log::Particulars::RingPerception)
    << "Ring perception: cycle rank " << rank << ", "
    << candidates.size() << " shortest cycles through single edges\n";

  std::vector<Ring> rings = select(candidates, rank);

  if(rings.size() < rank) {
    Log::log(Log::Particulars::RingPerception)
      << "Shortest cycles through single edges span only " << rings.size()
      << " dimensions, adding fundamental cycles\n";

    for(AtomIndex root = 0; root < V; ++root) {
      for(auto& cycle : fundamentalCycles(adjacency, root)) {
        candidates.push_back(makeCandidate(std::move(cycle), edgeIndices));
      }
    }

    rings = select(std::move(candidates), rank);
  }

  if(rings.size() != rank) {
    throw std::logic_error("Ring perception failed to span the cycle space");
  }

  Temple::sort(
    rings,
    [](const Ring& a, const Ring& b) {
      return std::make_tuple(a.size(), std::cref(a)) < std::make_tuple(b.size(), std::cref(b));
    }
  );

  return rings;
}

} // namespace Detail

bool ringContains(const Ring& ring, const BondIndex& bond) {
  const unsigned size = ring.size();
  for(unsigned i = 0; i < size; ++i) {
    if(BondIndex {ring.at(i), ring.at((i + 1) % size)} == bond) {
      return true;
    }
  }
  return false;
}

Cycles::Cycles(std::vector<Ring> rings) : rings_(std::move(rings)) {}

const std::vector<Ring>& Cycles::rings() const {
  return rings_;
}

unsigned Cycles::size() const {
  return rings_.size();
}

bool Cycles::empty() const {
  return rings_.empty();
}

std::vector<Ring> Cycles::containing(const AtomIndex i) const {
  std::vector<Ring> matches;
  for(const Ring& ring : rings_) {
    if(Temple::makeContainsPredicate(ring)(i)) {
      matches.push_back(ring);
    }
  }
  return matches;
}

std::vector<Ring> Cycles::containing(const BondIndex& bond) const {
  std::vector<Ring> matches;
  for(const Ring& ring : rings_) {
    if(ringContains(ring, bond)) {
      matches.push_back(ring);
    }
  }
  return matches;
}

boost::optional<unsigned> Cycles::smallestSizeContaining(const AtomIndex i) const {
  // Rings are ordered by size, so the first match is the smallest
  for(const Ring& ring : rings_) {
    if(Temple::makeContainsPredicate(ring)(i)) {
      return static_cast<unsigned>(ring.size());
    }
  }
  return boost::none;
}

std::vector<Ring>::const_iterator Cycles::begin() const {
  return std::begin(rings_);
}

std::vector<Ring>::const_iterator Cycles::end() const {
  return std::end(rings_);
}

} // namespace Chemgraph
} // namespace Scine
