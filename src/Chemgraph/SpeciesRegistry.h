/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Caller-owned pool of pairwise non-isomorphic molecules
 */

#ifndef INCLUDE_CHEMGRAPH_SPECIES_REGISTRY_H
#define INCLUDE_CHEMGRAPH_SPECIES_REGISTRY_H

#include "Chemgraph/Hashes.h"
#include "Chemgraph/Molecule.h"
#include "Chemgraph/SearchBound.h"

#include "boost/optional.hpp"

#include <unordered_map>
#include <vector>

namespace Scine {
namespace Chemgraph {

/**
 * @brief Deduplicating store of species
 *
 * Molecules are bucketed by Hashes::canonical. Lookups confirm candidates of
 * the matching bucket by isomorphism, so hash collisions never merge distinct
 * species. Indices of stored species are stable.
 *
 * The number of color refinement rounds is fixed at construction from
 * Options::Hashing::refinementIterations, so later changes of the option do
 * not affect existing registries.
 *
 * The registry has no shared state. Concurrent lookups are safe, insertion
 * must be serialized with all other access by the caller.
 */
class CHEMGRAPH_EXPORT SpeciesRegistry {
public:
  //! Result of an insertion
  struct Insertion {
    //! Index of the stored species isomorphic to the inserted molecule
    std::size_t index;
    //! Whether the molecule was new and has been stored
    bool inserted;
  };

  //! Registry with an unbounded isomorphism search
  SpeciesRegistry();
  //! Registry bounding each isomorphism search
  explicit SpeciesRegistry(SearchBound bound);

  /*! @brief Index of a stored species isomorphic to a molecule
   *
   * @throws std::system_error If the search bound is exceeded
   */
  boost::optional<std::size_t> find(const Molecule& molecule) const;

  /*! @brief Stores a molecule unless an isomorphic species is stored
   *
   * @throws std::system_error If the search bound is exceeded
   */
  Insertion insert(Molecule molecule);

  //! Number of stored species
  std::size_t size() const;

  /*! @brief Stored species by index
   *
   * @throws std::out_of_range If the index is not less than size()
   */
  const Molecule& at(std::size_t index) const;

private:
  boost::optional<std::size_t> findInBucket_(
    const Molecule& molecule,
    Hashes::HashType hash
  ) const;

  SearchBound bound_;
  unsigned refinementIterations_;
  std::vector<Molecule> species_;
  std::unordered_map<Hashes::HashType, std::vector<std::size_t>> buckets_;
};

} // namespace Chemgraph
} // namespace Scine

#endif
