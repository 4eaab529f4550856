/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/SpeciesRegistry.h"

#include "Chemgraph/Log.h"
#include "Chemgraph/Options.h"
#include "Chemgraph/Subgraphs.h"

namespace Scine {
namespace Chemgraph {

SpeciesRegistry::SpeciesRegistry() : SpeciesRegistry(SearchBound::unbounded()) {}

SpeciesRegistry::SpeciesRegistry(SearchBound bound)
  : bound_(std::move(bound)),
    refinementIterations_(Options::Hashing::refinementIterations) {}

boost::optional<std::size_t> SpeciesRegistry::findInBucket_(
  const Molecule& molecule,
  const Hashes::HashType hash
) const {
  const auto findIter = buckets_.find(hash);
  if(findIter == std::end(buckets_)) {
    return boost::none;
  }

  for(const std::size_t index : findIter->second) {
    if(Subgraphs::isomorphism(species_.at(index), molecule, bound_).value()) {
      return index;
    }
  }

  Log::log(Log::Particulars::SpeciesRegistry)
    << "Canonical hash collision in bucket of size " << findIter->second.size() << "\n";

  return boost::none;
}

boost::optional<std::size_t> SpeciesRegistry::find(const Molecule& molecule) const {
  return findInBucket_(molecule, Hashes::canonical(molecule, refinementIterations_));
}

SpeciesRegistry::Insertion SpeciesRegistry::insert(Molecule molecule) {
  const Hashes::HashType hash = Hashes::canonical(molecule, refinementIterations_);
  if(auto indexOption = findInBucket_(molecule, hash)) {
    return {*indexOption, false};
  }

  const std::size_t index = species_.size();
  species_.push_back(std::move(molecule));
  buckets_[hash].push_back(index);

  Log::log(Log::Particulars::SpeciesRegistry)
    << "Registered species " << index << " with " << buckets_.size() << " buckets\n";

  return {index, true};
}

std::size_t SpeciesRegistry::size() const {
  return species_.size();
}

const Molecule& SpeciesRegistry::at(const std::size_t index) const {
  return species_.at(index);
}

} // namespace Chemgraph
} // namespace Scine
