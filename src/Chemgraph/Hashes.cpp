/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/Hashes.h"

#include "Chemgraph/Molecule.h"
#include "Chemgraph/Options.h"
#include "Chemgraph/Temple/Functional.h"

#include "boost/functional/hash.hpp"

#include <type_traits>
#include <utility>

namespace Scine {
namespace Chemgraph {
namespace Hashes {

HashType atomHash(const Atom& atom) {
  using ElementTypeUnderlying = std::underlying_type<Utils::ElementType>::type;

  // Element type values encode both atomic number and mass number
  HashType seed = static_cast<ElementTypeUnderlying>(atom.element);
  boost::hash_combine(seed, atom.radicalElectrons);
  boost::hash_combine(seed, atom.charge);
  boost::hash_combine(seed, atom.lonePairs);
  return seed;
}

std::vector<HashType> vertexColors(const Molecule& molecule, const unsigned iterations) {
  using BondTypeUnderlying = std::underlying_type<BondType>::type;

  std::vector<HashType> colors = Temple::map(
    molecule.vertices(),
    [&](const AtomIndex i) { return atomHash(molecule.atom(i)); }
  );

  const auto& graph = molecule.graph();
  std::vector<std::pair<BondTypeUnderlying, HashType>> environment;
  for(unsigned round = 0; round < iterations; ++round) {
    std::vector<HashType> refined(colors.size());
    for(const AtomIndex i : molecule.vertices()) {
      environment.clear();
      for(const auto& e : graph.edges(i)) {
        const AtomIndex j = graph.bondIndex(e).other(i);
        environment.emplace_back(
          static_cast<BondTypeUnderlying>(graph.label(e)),
          colors.at(j)
        );
      }
      Temple::sort(environment);

      HashType seed = colors.at(i);
      for(const auto& bondColorPair : environment) {
        boost::hash_combine(seed, bondColorPair.first);
        boost::hash_combine(seed, bondColorPair.second);
      }
      refined.at(i) = seed;
    }
    colors = std::move(refined);
  }

  return colors;
}

std::vector<HashType> vertexColors(const Molecule& molecule) {
  return vertexColors(molecule, Options::Hashing::refinementIterations);
}

HashType canonical(const Molecule& molecule, const unsigned iterations) {
  HashType seed = molecule.V();
  boost::hash_combine(seed, molecule.E());
  const std::vector<HashType> colors = Temple::sorted(vertexColors(molecule, iterations));
  boost::hash_range(seed, std::begin(colors), std::end(colors));
  return seed;
}

HashType canonical(const Molecule& molecule) {
  return canonical(molecule, Options::Hashing::refinementIterations);
}

} // namespace Hashes
} // namespace Chemgraph
} // namespace Scine
