/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Isomorphism, subgraph and automorphism queries on molecules and groups
 *
 * All queries take a SearchBound and report an exceeded bound as
 * MatchError::SearchAborted in the returned result. The absence of a mapping
 * is a regular value, i.e. boost::none or an empty list.
 */

#ifndef INCLUDE_CHEMGRAPH_SUBGRAPHS_H
#define INCLUDE_CHEMGRAPH_SUBGRAPHS_H

#include "Chemgraph/Error.h"
#include "Chemgraph/Options.h"
#include "Chemgraph/SearchBound.h"
#include "Chemgraph/Types.h"

#include "boost/optional.hpp"
#include "boost/outcome.hpp"
#include "boost/outcome/std_result.hpp"

#include <utility>
#include <vector>

namespace Scine {
namespace Chemgraph {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

// Forward-declarations
class Molecule;
class Group;

namespace Subgraphs {

/*! @brief Finds an isomorphism between two molecules
 *
 * Atoms correspond if they are equivalent (element type including isotope,
 * radical electrons, charge and lone pairs; labels are ignored). Bonds
 * correspond if their bond types are equal.
 *
 * @param a The first molecule, left indices of the mapping
 * @param b The second molecule, right indices of the mapping
 * @param bound Limits on the search
 *
 * @throws InvalidInput If either molecule violates the simple graph invariant
 *
 * @returns A bijective mapping of atoms if the molecules are isomorphic,
 *   boost::none if they are not, or MatchError::SearchAborted
 */
CHEMGRAPH_EXPORT outcome::std_result<boost::optional<IndexMap>> isomorphism(
  const Molecule& a,
  const Molecule& b,
  const SearchBound& bound
);

/*! @brief Finds an embedding of a group into a molecule
 *
 * Group atoms match molecule atoms by matchesLabel with the molecule atom's
 * perceived atom type, group bonds match by matchesLabel with the bond type.
 * Only bonds between group atoms are checked, further molecule bonds are
 * ignored.
 *
 * @param pattern Group to embed, left indices of the mapping
 * @param target Molecule to embed into, right indices of the mapping
 * @param bound Limits on the search
 * @param initial Pairs of group and molecule atoms that must map onto each
 *   other
 *
 * @throws InvalidInput If an index of @p initial does not exist
 */
CHEMGRAPH_EXPORT outcome::std_result<boost::optional<IndexMap>> subgraph(
  const Group& pattern,
  const Molecule& target,
  const SearchBound& bound,
  const IndexMap& initial = IndexMap {}
);

/*! @brief Enumerates all embeddings of a group into a molecule
 *
 * @param pattern Group to embed, left indices of the mappings
 * @param target Molecule to embed into, right indices of the mappings
 * @param bound Limits on the whole enumeration
 * @param initial Pairs of group and molecule atoms that must map onto each
 *   other
 * @param deduplication Whether mappings related by a symmetry of the pattern
 *   are reported once
 *
 * @throws InvalidInput If an index of @p initial does not exist
 */
CHEMGRAPH_EXPORT outcome::std_result<std::vector<IndexMap>> subgraphs(
  const Group& pattern,
  const Molecule& target,
  const SearchBound& bound,
  const IndexMap& initial = IndexMap {},
  MappingDeduplication deduplication = Options::Matching::deduplication
);

/*! @brief Finds an embedding of a generic group into a more specific one
 *
 * A pattern atom (bond) matches a target atom (bond) if the target's is a
 * specific case of the pattern's, see GroupAtom::isSpecificCaseOf and
 * GroupBond::isSpecificCaseOf.
 */
CHEMGRAPH_EXPORT outcome::std_result<boost::optional<IndexMap>> subgraph(
  const Group& pattern,
  const Group& target,
  const SearchBound& bound,
  const IndexMap& initial = IndexMap {}
);

//! Enumerates all embeddings of a generic group into a more specific one
CHEMGRAPH_EXPORT outcome::std_result<std::vector<IndexMap>> subgraphs(
  const Group& pattern,
  const Group& target,
  const SearchBound& bound,
  const IndexMap& initial = IndexMap {},
  MappingDeduplication deduplication = Options::Matching::deduplication
);

/*! @brief Enumerates all automorphisms of a molecule fixing anchor atoms
 *
 * The identity is always among the results unless the search is aborted.
 *
 * @param molecule Molecule to map onto itself
 * @param anchors Atoms each of which must map onto itself
 * @param bound Limits on the whole enumeration
 *
 * @throws InvalidInput If an anchor does not exist
 */
CHEMGRAPH_EXPORT outcome::std_result<std::vector<IndexMap>> automorphisms(
  const Molecule& molecule,
  const std::vector<AtomIndex>& anchors,
  const SearchBound& bound
);

/*! @brief Enumerates all label-preserving automorphisms of a group
 *
 * Atoms correspond if their GroupAtoms are equal including their labels,
 * bonds if their GroupBonds are equal.
 */
CHEMGRAPH_EXPORT outcome::std_result<std::vector<IndexMap>> automorphisms(
  const Group& group,
  const SearchBound& bound
);

/*! @brief Pairs group and molecule atoms carrying the same label
 *
 * @returns boost::none if any group label is not carried by exactly one
 *   group atom and exactly one molecule atom. An empty map if the group has
 *   no labeled atoms.
 */
CHEMGRAPH_EXPORT boost::optional<IndexMap> initialMapFromLabels(
  const Group& group,
  const Molecule& molecule
);

/*! @brief Edge correspondence implied by a vertex mapping
 *
 * @param map Complete mapping of the source's vertices (left) to target
 *   vertices (right)
 * @param source Graph whose bonds are mapped
 *
 * @throws std::out_of_range If a source atom is not mapped
 *
 * @returns Pairs of source bond and target bond for every source bond
 */
template<class SourceGraph>
std::vector<std::pair<BondIndex, BondIndex>> impliedBonds(
  const IndexMap& map,
  const SourceGraph& source
) {
  std::vector<std::pair<BondIndex, BondIndex>> correspondence;
  for(const BondIndex& bond : source.edges()) {
    correspondence.emplace_back(
      bond,
      BondIndex {map.left.at(bond.first), map.left.at(bond.second)}
    );
  }
  return correspondence;
}

} // namespace Subgraphs
} // namespace Chemgraph
} // namespace Scine

#endif
