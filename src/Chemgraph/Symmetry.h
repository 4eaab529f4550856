/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Symmetry numbers and equivalent atoms from graph automorphisms
 */

#ifndef INCLUDE_CHEMGRAPH_SYMMETRY_H
#define INCLUDE_CHEMGRAPH_SYMMETRY_H

#include "Chemgraph/Error.h"
#include "Chemgraph/SearchBound.h"
#include "Chemgraph/Types.h"

#include "boost/outcome.hpp"
#include "boost/outcome/std_result.hpp"

#include <vector>

namespace Scine {
namespace Chemgraph {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

// Forward-declarations
class Molecule;

/*! @brief Number of automorphisms of a molecule fixing anchor atoms
 *
 * Without anchors, this is the global symmetry number of the species. With
 * anchors, e.g. the reactive atoms of a reaction site, each anchor must map
 * onto itself, yielding a local symmetry number.
 *
 * Automorphisms are counted, not stored.
 *
 * @param molecule Molecule to count automorphisms of
 * @param anchors Atoms that each must map onto themselves
 * @param bound Limits on the enumeration
 *
 * @throws InvalidInput If an anchor does not exist
 *
 * @returns A count of at least one, or MatchError::SearchAborted
 */
CHEMGRAPH_EXPORT outcome::std_result<unsigned> symmetryNumber(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors,
  const SearchBound& bound
);

/*! @brief Unbounded number of automorphisms of a molecule fixing anchor atoms
 *
 * @throws InvalidInput If an anchor does not exist
 */
CHEMGRAPH_EXPORT unsigned symmetryNumber(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors = {}
);

/*! @brief Orbits of the atoms under the anchor-fixing automorphisms
 *
 * Two atoms are in the same set if some automorphism fixing every anchor maps
 * one onto the other. Each set is sorted and the sets are ordered by their
 * smallest atom index. Every atom is in exactly one set.
 *
 * @throws InvalidInput If an anchor does not exist
 */
CHEMGRAPH_EXPORT outcome::std_result<std::vector<std::vector<AtomIndex>>> equivalentAtomSets(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors,
  const SearchBound& bound
);

//! Unbounded variant of equivalentAtomSets
CHEMGRAPH_EXPORT std::vector<std::vector<AtomIndex>> equivalentAtomSets(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors = {}
);

/*! @brief Whether some automorphism of the molecule maps atom i onto atom j
 *
 * Searches for a single automorphism with i pinned to j.
 *
 * @throws InvalidInput If either atom does not exist
 */
CHEMGRAPH_EXPORT bool equivalentAtoms(const Molecule& molecule, AtomIndex i, AtomIndex j);

} // namespace Chemgraph
} // namespace Scine

#endif
