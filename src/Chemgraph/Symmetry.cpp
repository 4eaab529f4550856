/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/Symmetry.h"

#include "Chemgraph/Hashes.h"
#include "Chemgraph/Isomorphism.h"
#include "Chemgraph/Molecule.h"
#include "Chemgraph/Temple/Functional.h"

#include <map>
#include <numeric>

namespace Scine {
namespace Chemgraph {
namespace {

using PinList = std::vector<std::pair<AtomIndex, AtomIndex>>;

template<typename F>
auto withAutomorphismMatcher(
  const Molecule& molecule,
  const PinList& pins,
  const SearchBound& bound,
  F&& f
) {
  const std::vector<Hashes::HashType> colors = Hashes::vertexColors(molecule);
  auto matcher = Isomorphism::makeMatcher(
    molecule.graph(),
    molecule.graph(),
    [&](const AtomIndex s, const AtomIndex t) {
      return molecule.atom(s).equivalent(molecule.atom(t));
    },
    [&](const BondIndex& s, const BondIndex& t) {
      return molecule.bondType(s) == molecule.bondType(t);
    },
    Isomorphism::Mode::Automorphism,
    bound,
    pins,
    colors,
    colors
  );

  return f(matcher);
}

PinList fixed(const std::vector<AtomIndex>& anchors) {
  return Temple::map(anchors, [](const AtomIndex i) { return std::make_pair(i, i); });
}

//! Disjoint sets with path halving
class UnionFind {
public:
  explicit UnionFind(const std::size_t N) : parents_(N) {
    std::iota(std::begin(parents_), std::end(parents_), 0);
  }

  std::size_t find(std::size_t i) {
    while(parents_.at(i) != i) {
      parents_.at(i) = parents_.at(parents_.at(i));
      i = parents_.at(i);
    }
    return i;
  }

  void join(const std::size_t a, const std::size_t b) {
    const std::size_t rootA = find(a);
    const std::size_t rootB = find(b);
    if(rootA < rootB) {
      parents_.at(rootB) = rootA;
    } else if(rootB < rootA) {
      parents_.at(rootA) = rootB;
    }
  }

private:
  std::vector<std::size_t> parents_;
};

} // namespace

outcome::std_result<unsigned> symmetryNumber(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors,
  const SearchBound& bound
) {
  auto countResult = withAutomorphismMatcher(
    molecule,
    fixed(anchors),
    bound,
    [](auto& matcher) { return matcher.count(); }
  );

  if(!countResult) {
    return countResult.error();
  }

  return static_cast<unsigned>(countResult.value());
}

unsigned symmetryNumber(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors
) {
  return symmetryNumber(molecule, anchors, SearchBound::unbounded()).value();
}

outcome::std_result<std::vector<std::vector<AtomIndex>>> equivalentAtomSets(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors,
  const SearchBound& bound
) {
  UnionFind orbits(molecule.V());
  auto enumeration = withAutomorphismMatcher(
    molecule,
    fixed(anchors),
    bound,
    [&](auto& matcher) {
      return matcher.forEach(
        [&](const std::vector<AtomIndex>& flat) {
          for(AtomIndex i = 0; i < flat.size(); ++i) {
            orbits.join(i, flat.at(i));
          }
          return true;
        }
      );
    }
  );

  if(!enumeration) {
    return enumeration.error();
  }

  // Roots are the smallest members, so the map orders sets by smallest member
  std::map<std::size_t, std::vector<AtomIndex>> sets;
  for(const AtomIndex i : molecule.vertices()) {
    sets[orbits.find(i)].push_back(i);
  }

  std::vector<std::vector<AtomIndex>> grouped;
  grouped.reserve(sets.size());
  for(auto& rootSetPair : sets) {
    grouped.push_back(std::move(rootSetPair.second));
  }
  return grouped;
}

std::vector<std::vector<AtomIndex>> equivalentAtomSets(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors
) {
  return equivalentAtomSets(molecule, anchors, SearchBound::unbounded()).value();
}

bool equivalentAtoms(const Molecule& molecule, const AtomIndex i, const AtomIndex j) {
  auto firstResult = withAutomorphismMatcher(
    molecule,
    PinList {{i, j}},
    SearchBound::unbounded(),
    [](auto& matcher) { return matcher.findFirst(); }
  );

  return static_cast<bool>(firstResult.value());
}

} // namespace Chemgraph
} // namespace Scine
