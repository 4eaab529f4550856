/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory for Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/Types.h"

#include "boost/functional/hash.hpp"

#include <tuple>
#include <iterator>
#include <stdexcept>

namespace Scine {
namespace Chemgraph {

static_assert(
  static_cast<std::underlying_type<BondType>::type>(BondType::Aromatic) == nBondTypes - 1,
  "Did you add a bond type and not alter nBondTypes?"
);

BondIndex::BondIndex() = default;

BondIndex::BondIndex(AtomIndex a, AtomIndex b) noexcept : first(a), second(b) {
  if(second < first) {
    std::swap(first, second);
  }
}

bool BondIndex::contains(const AtomIndex a) const {
  return a == first || a == second;
}

AtomIndex BondIndex::other(const AtomIndex a) const {
  if(a == first) {
    return second;
  }

  if(a == second) {
    return first;
  }

  throw std::out_of_range("Atom index is not part of the bond");
}

bool BondIndex::operator < (const BondIndex& other) const {
  return std::tie(first, second) < std::tie(other.first, other.second);
}

bool BondIndex::operator == (const BondIndex& other) const {
  return std::tie(first, second) == std::tie(other.first, other.second);
}

bool BondIndex::operator != (const BondIndex& other) const {
  return !(*this == other);
}

BondIndex::const_iterator BondIndex::begin() const {
  return &first;
}

BondIndex::const_iterator BondIndex::end() const {
  return std::next(&second);
}

std::size_t hash_value(const BondIndex& bond) {
  std::size_t seed = 0;
  boost::hash_combine(seed, bond.first);
  boost::hash_combine(seed, bond.second);
  return seed;
}

char symbol(const BondType bondType) {
  switch(bondType) {
    case BondType::Single: return 'S';
    case BondType::Double: return 'D';
    case BondType::Triple: return 'T';
    case BondType::Aromatic: return 'B';
  }

  throw std::logic_error("Unhandled bond type");
}

double order(const BondType bondType) {
  switch(bondType) {
    case BondType::Single: return 1.0;
    case BondType::Double: return 2.0;
    case BondType::Triple: return 3.0;
    case BondType::Aromatic: return 1.5;
  }

  throw std::logic_error("Unhandled bond type");
}

} // namespace Chemgraph
} // namespace Scine
