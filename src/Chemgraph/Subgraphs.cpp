/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/Subgraphs.h"

#include "Chemgraph/Group.h"
#include "Chemgraph/Hashes.h"
#include "Chemgraph/Isomorphism.h"
#include "Chemgraph/Log.h"
#include "Chemgraph/Molecule.h"
#include "Chemgraph/Temple/Functional.h"

#include <map>

namespace Scine {
namespace Chemgraph {
namespace Subgraphs {
namespace {

using PinList = std::vector<std::pair<AtomIndex, AtomIndex>>;
using FlatMap = std::vector<AtomIndex>;

PinList pins(const IndexMap& initial) {
  PinList pairs;
  for(const auto& pair : initial.left) {
    pairs.emplace_back(pair.first, pair.second);
  }
  return pairs;
}

IndexMap toIndexMap(const FlatMap& flat) {
  IndexMap map;
  for(AtomIndex i = 0; i < flat.size(); ++i) {
    map.insert(IndexMap::value_type(i, flat.at(i)));
  }
  return map;
}

template<class Matcher>
outcome::std_result<std::vector<FlatMap>> collect(Matcher& matcher) {
  std::vector<FlatMap> flats;
  auto result = matcher.forEach(
    [&](const FlatMap& flat) {
      flats.push_back(flat);
      return true;
    }
  );

  if(!result) {
    return result.error();
  }

  return flats;
}

outcome::std_result<std::vector<FlatMap>> groupSymmetries(
  const Group& group,
  const SearchBound& bound
) {
  auto matcher = Isomorphism::makeMatcher(
    group.graph(),
    group.graph(),
    [&](const AtomIndex s, const AtomIndex t) {
      return group.atom(s) == group.atom(t);
    },
    [&](const BondIndex& s, const BondIndex& t) {
      return group.bond(s) == group.bond(t);
    },
    Isomorphism::Mode::Automorphism,
    bound
  );

  return collect(matcher);
}

/* Collapses mappings f and f∘σ for pattern automorphisms σ. Each class is
 * represented by the smallest mapping that was actually found, so that pins
 * of the search are respected by the representatives.
 */
outcome::std_result<std::vector<IndexMap>> finalize(
  const std::vector<FlatMap>& flats,
  const Group& pattern,
  const SearchBound& bound,
  const MappingDeduplication deduplication
) {
  if(deduplication == MappingDeduplication::None) {
    return Temple::map(flats, toIndexMap);
  }

  auto symmetriesResult = groupSymmetries(pattern, bound);
  if(!symmetriesResult) {
    return symmetriesResult.error();
  }
  const std::vector<FlatMap>& symmetries = symmetriesResult.value();

  std::map<FlatMap, FlatMap> representatives;
  FlatMap composed;
  for(const FlatMap& flat : flats) {
    FlatMap key = flat;
    for(const FlatMap& symmetry : symmetries) {
      composed = Temple::map(symmetry, [&](const AtomIndex v) { return flat.at(v); });
      if(composed < key) {
        key = composed;
      }
    }

    auto findIter = representatives.find(key);
    if(findIter == std::end(representatives)) {
      representatives.emplace(std::move(key), flat);
    } else if(flat < findIter->second) {
      findIter->second = flat;
    }
  }

  std::vector<FlatMap> kept;
  kept.reserve(representatives.size());
  for(const auto& keyFlatPair : representatives) {
    kept.push_back(keyFlatPair.second);
  }
  Temple::sort(kept);

  Log::log(Log::Particulars::IsomorphismSearch)
    << "Pattern symmetry of order " << symmetries.size() << " collapsed "
    << flats.size() << " mappings to " << kept.size() << "\n";

  return Temple::map(kept, toIndexMap);
}

auto makeMoleculeMatcher(
  const Group& pattern,
  const Molecule& target,
  const std::vector<AtomType>& types,
  const SearchBound& bound,
  const IndexMap& initial
) {
  return Isomorphism::makeMatcher(
    pattern.graph(),
    target.graph(),
    [&pattern, &target, &types](const AtomIndex s, const AtomIndex t) {
      return matchesLabel(pattern.atom(s), target.atom(t), types.at(t));
    },
    [&pattern, &target](const BondIndex& s, const BondIndex& t) {
      return matchesLabel(pattern.bond(s), target.bondType(t));
    },
    Isomorphism::Mode::Subgraph,
    bound,
    pins(initial)
  );
}

auto makeGroupMatcher(
  const Group& pattern,
  const Group& target,
  const SearchBound& bound,
  const IndexMap& initial
) {
  return Isomorphism::makeMatcher(
    pattern.graph(),
    target.graph(),
    [&pattern, &target](const AtomIndex s, const AtomIndex t) {
      return target.atom(t).isSpecificCaseOf(pattern.atom(s));
    },
    [&pattern, &target](const BondIndex& s, const BondIndex& t) {
      return target.bond(t).isSpecificCaseOf(pattern.bond(s));
    },
    Isomorphism::Mode::Subgraph,
    bound,
    pins(initial)
  );
}

} // namespace

outcome::std_result<boost::optional<IndexMap>> isomorphism(
  const Molecule& a,
  const Molecule& b,
  const SearchBound& bound
) {
  auto matcher = Isomorphism::makeMatcher(
    a.graph(),
    b.graph(),
    [&](const AtomIndex s, const AtomIndex t) {
      return a.atom(s).equivalent(b.atom(t));
    },
    [&](const BondIndex& s, const BondIndex& t) {
      return a.bondType(s) == b.bondType(t);
    },
    Isomorphism::Mode::Exact,
    bound,
    {},
    Hashes::vertexColors(a),
    Hashes::vertexColors(b)
  );

  return matcher.findFirst();
}

outcome::std_result<boost::optional<IndexMap>> subgraph(
  const Group& pattern,
  const Molecule& target,
  const SearchBound& bound,
  const IndexMap& initial
) {
  const std::vector<AtomType> types = target.atomTypes();
  auto matcher = makeMoleculeMatcher(pattern, target, types, bound, initial);
  return matcher.findFirst();
}

outcome::std_result<std::vector<IndexMap>> subgraphs(
  const Group& pattern,
  const Molecule& target,
  const SearchBound& bound,
  const IndexMap& initial,
  const MappingDeduplication deduplication
) {
  const std::vector<AtomType> types = target.atomTypes();
  auto matcher = makeMoleculeMatcher(pattern, target, types, bound, initial);
  auto flatsResult = collect(matcher);
  if(!flatsResult) {
    return flatsResult.error();
  }

  return finalize(flatsResult.value(), pattern, bound, deduplication);
}

outcome::std_result<boost::optional<IndexMap>> subgraph(
  const Group& pattern,
  const Group& target,
  const SearchBound& bound,
  const IndexMap& initial
) {
  auto matcher = makeGroupMatcher(pattern, target, bound, initial);
  return matcher.findFirst();
}

outcome::std_result<std::vector<IndexMap>> subgraphs(
  const Group& pattern,
  const Group& target,
  const SearchBound& bound,
  const IndexMap& initial,
  const MappingDeduplication deduplication
) {
  auto matcher = makeGroupMatcher(pattern, target, bound, initial);
  auto flatsResult = collect(matcher);
  if(!flatsResult) {
    return flatsResult.error();
  }

  return finalize(flatsResult.value(), pattern, bound, deduplication);
}

outcome::std_result<std::vector<IndexMap>> automorphisms(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors,
  const SearchBound& bound
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
    Temple::map(anchors, [](const AtomIndex i) { return std::make_pair(i, i); }),
    colors,
    colors
  );

  return matcher.findAll();
}

outcome::std_result<std::vector<IndexMap>> automorphisms(
  const Group& group,
  const SearchBound& bound
) {
  auto flatsResult = groupSymmetries(group, bound);
  if(!flatsResult) {
    return flatsResult.error();
  }

  return Temple::map(flatsResult.value(), toIndexMap);
}

boost::optional<IndexMap> initialMapFromLabels(
  const Group& group,
  const Molecule& molecule
) {
  const auto moleculeLabels = molecule.labeledAtoms();
  IndexMap map;
  for(const auto& labelAtomsPair : group.labeledAtoms()) {
    if(labelAtomsPair.second.size() != 1) {
      return boost::none;
    }

    const auto findIter = moleculeLabels.find(labelAtomsPair.first);
    if(findIter == std::end(moleculeLabels) || findIter->second.size() != 1) {
      return boost::none;
    }

    map.insert(
      IndexMap::value_type(labelAtomsPair.second.front(), findIter->second.front())
    );
  }

  return map;
}

} // namespace Subgraphs
} // namespace Chemgraph
} // namespace Scine
