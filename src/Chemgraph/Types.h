/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Defines basic types widely shared across the project.
 */

#ifndef INCLUDE_CHEMGRAPH_SHARED_TYPES_H
#define INCLUDE_CHEMGRAPH_SHARED_TYPES_H

#include "Chemgraph/Export.h"

#include "boost/bimap.hpp"

#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

namespace Scine {

//! @brief Central library namespace
namespace Chemgraph {

/*!
 * @brief Discrete bond order enumeration
 *
 * Besides the classic single, double and triple bonds, delocalized bonds in
 * aromatic rings are a bond order of their own and never equivalent to a
 * localized single or double bond.
 */
enum class CHEMGRAPH_EXPORT BondType : unsigned {
  Single,
  Double,
  Triple,
  Aromatic
};

//! Number of distinct bond types present in the library
constexpr unsigned nBondTypes = 4;

//! Unsigned integer atom index type. Used to refer to particular atoms.
using AtomIndex = std::size_t;

//! Type used to refer to particular bonds. Orders first < second.
struct CHEMGRAPH_EXPORT BondIndex {
  //! Pointer to member iteration over both atom indices
  using const_iterator = const AtomIndex*;

  //! Smaller atom index
  AtomIndex first;
  //! Larger atom index
  AtomIndex second;

  //! Default constructor, leaves members uninitialized
  BondIndex();
  //! Component constructor, establishes ordering
  BondIndex(AtomIndex a, AtomIndex b) noexcept;

  //! Whether first or second is @p a
  bool contains(AtomIndex a) const;

  //! Yields the other atom index of the bond
  AtomIndex other(AtomIndex a) const;

  //! Lexicographic comparison
  bool operator < (const BondIndex& other) const;
  //! Lexicographic comparison
  bool operator == (const BondIndex& other) const;
  bool operator != (const BondIndex& other) const;

  //! Returns the address of first
  const_iterator begin() const;

  //! Returns the address past second
  const_iterator end() const;
};

/*! @brief Hash for BondIndex so it can be used as a key type in unordered containers
 *
 * @complexity{@math{\Theta(1)}}
 */
CHEMGRAPH_EXPORT std::size_t hash_value(const BondIndex& bond);

/*!
 * @brief Type used to represent vertex mappings between graphs
 *
 * Left vertices are pattern (or source) atom indices, right vertices are
 * target atom indices.
 */
using IndexMap = boost::bimap<AtomIndex, AtomIndex>;

//! A ring as a closed sequence of atom indices (last atom bonded to first)
using Ring = std::vector<AtomIndex>;

//! Single character bond order symbol in adjacency list notation (S, D, T, B)
CHEMGRAPH_EXPORT char symbol(BondType bondType);

//! Nominal bond order, aromatic bonds have an order of one and a half
CHEMGRAPH_EXPORT double order(BondType bondType);

} // namespace Chemgraph
} // namespace Scine

#endif
