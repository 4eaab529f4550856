/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Vertex invariants and canonical hashes of molecules
 *
 * Hashes are refined by iterated neighborhood aggregation (color refinement).
 * Isomorphic molecules always yield equal hashes. Unequal molecules may
 * collide, so equal hashes must be confirmed by an isomorphism search.
 */

#ifndef INCLUDE_CHEMGRAPH_HASHES_H
#define INCLUDE_CHEMGRAPH_HASHES_H

#include "Chemgraph/Export.h"

#include <cstddef>
#include <vector>

namespace Scine {
namespace Chemgraph {

// Forward-declarations
struct Atom;
class Molecule;

namespace Hashes {

using HashType = std::size_t;

//! Hash of an atom state, excluding its label
CHEMGRAPH_EXPORT HashType atomHash(const Atom& atom);

/*! @brief Refined vertex colors of a molecule
 *
 * Initial colors are atom hashes. In each round, a vertex color is combined
 * with the sorted list of (bond type, neighbor color) pairs of its bonds.
 * Vertices that can map onto each other in an isomorphism always have equal
 * colors.
 *
 * @param molecule Molecule to color
 * @param iterations Number of refinement rounds
 *
 * @complexity{@math{\Theta(k (V + E \log E))} for @math{k} rounds}
 */
CHEMGRAPH_EXPORT std::vector<HashType> vertexColors(
  const Molecule& molecule,
  unsigned iterations
);

/*! @brief Refined vertex colors with Options::Hashing::refinementIterations
 *   rounds
 */
CHEMGRAPH_EXPORT std::vector<HashType> vertexColors(const Molecule& molecule);

/*! @brief Hash of a molecule that is independent of atom order
 *
 * Combines the numbers of atoms and bonds with the sorted vertex colors
 * after a number of rounds of refinement. Hashes are only comparable if
 * computed with the same number of rounds.
 */
CHEMGRAPH_EXPORT HashType canonical(const Molecule& molecule, unsigned iterations);

//! Canonical hash with Options::Hashing::refinementIterations rounds
CHEMGRAPH_EXPORT HashType canonical(const Molecule& molecule);

} // namespace Hashes
} // namespace Chemgraph
} // namespace Scine

#endif
