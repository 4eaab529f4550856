/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Wildcard atom types and their perception from local bonding
 *
 * Atom types classify an atom by element and by the orders of the bonds it
 * participates in. They form a hierarchy: every specific type (e.g. Cd, a
 * carbon with one double bond) is a specific case of its generic ancestors
 * (C, RnotH and R). Groups list acceptable atom types on their atoms.
 */

#ifndef INCLUDE_CHEMGRAPH_ATOM_TYPES_H
#define INCLUDE_CHEMGRAPH_ATOM_TYPES_H

#include "Chemgraph/Temple/Bitmask.h"
#include "Chemgraph/Types.h"

#include "Utils/Geometry/ElementTypes.h"

#include <string>

namespace Scine {
namespace Chemgraph {

//! Atom types in hierarchy order, generic types precede their specific cases
enum class CHEMGRAPH_EXPORT AtomType : unsigned {
  //! Any atom
  R,
  //! Any atom but hydrogen
  RnotH,
  //! Any carbon
  C,
  //! Carbon with only single bonds
  Cs,
  //! Carbon with one double bond to a non-oxygen atom
  Cd,
  //! Carbon with two double bonds
  Cdd,
  //! Carbon with one triple bond
  Ct,
  //! Carbon with one double bond to oxygen
  CO,
  //! Carbon with one or two aromatic bonds
  Cb,
  //! Carbon with three aromatic bonds, fused ring position
  Cbf,
  //! Hydrogen of any isotope
  H,
  //! Any oxygen
  O,
  //! Oxygen with only single bonds
  Os,
  //! Oxygen with one double bond
  Od,
  //! Oxygen without any bonds
  Oa,
  //! Oxygen with one triple bond
  Ot,
  //! Any nitrogen
  N,
  //! Any sulfur
  S,
  //! Sulfur with only single bonds
  Ss,
  //! Sulfur with one double bond
  Sd,
  //! Any silicon
  Si,
  //! Silicon with only single bonds
  Sis,
  //! Silicon with one double bond to a non-oxygen atom
  Sid,
  //! Silicon with two double bonds
  Sidd,
  //! Silicon with one triple bond
  Sit,
  //! Silicon with one double bond to oxygen
  SiO,
  //! Silicon with one or two aromatic bonds
  Sib,
  //! Silicon with three aromatic bonds
  Sibf
};

//! Number of atom types
constexpr unsigned nAtomTypes = 28;

//! Set of atom types
using AtomTypeSet = Temple::Bitmask<AtomType>;

//! Counts of the bonds of an atom by order
struct CHEMGRAPH_EXPORT BondCounts {
  unsigned single = 0;
  //! All double bonds, including those to oxygen
  unsigned doubles = 0;
  //! Double bonds to oxygen
  unsigned doublesToOxygen = 0;
  unsigned triple = 0;
  unsigned aromatic = 0;

  //! Total number of bonds
  unsigned total() const;
};

/*! @brief Most specific atom type of an atom
 *
 * Isotopes are typed as their base element. Atoms of elements without atom
 * types of their own are RnotH. Atoms of typed elements whose bonding fits
 * no specific type receive the generic type of their element.
 *
 * @complexity{@math{\Theta(1)}}
 */
CHEMGRAPH_EXPORT AtomType perceiveAtomType(Utils::ElementType element, const BondCounts& counts);

//! Direct generic ancestor of an atom type. R is its own parent.
CHEMGRAPH_EXPORT AtomType parent(AtomType type);

/*! @brief Whether @p type is @p other or a more specific type of it
 *
 * E.g. Cd is a specific case of C, RnotH and R, but not of Cs or H.
 *
 * @complexity{@math{O(\textrm{depth})}}
 */
CHEMGRAPH_EXPORT bool isSpecificCaseOf(AtomType type, AtomType other);

/*! @brief Whether @p type is a specific case of any type in @p set
 *
 * @complexity{@math{O(\textrm{depth})}}
 */
CHEMGRAPH_EXPORT bool isSpecificCaseOf(AtomType type, const AtomTypeSet& set);

//! Name of an atom type, e.g. "Cd"
CHEMGRAPH_EXPORT std::string name(AtomType type);

} // namespace Chemgraph
} // namespace Scine

#endif
