/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#ifndef INCLUDE_CHEMGRAPH_TEST_FIXTURES_H
#define INCLUDE_CHEMGRAPH_TEST_FIXTURES_H

#include "Chemgraph/Molecule.h"
#include "Chemgraph/Options.h"

namespace Scine {
namespace Chemgraph {
namespace Fixtures {

//! Two carbon atoms joined by a double bond, no hydrogens
Molecule carbonPair();
//! C2H6, carbons first
Molecule ethane();
//! C2H4, carbons first
Molecule ethylene();
//! CH2O, carbon first, oxygen second
Molecule formaldehyde();
//! CH4, carbon first
Molecule methane();
//! Six-membered carbon ring with aromatic bonds only
Molecule aromaticBenzene();
//! Six-membered carbon ring with alternating single and double bonds
Molecule kekuleBenzene();
//! Carbon skeleton of naphthalene with aromatic bonds
Molecule naphthalene();
//! Ring of @p n carbon atoms joined by single bonds
Molecule carbonRing(unsigned n);
//! Two disconnected rings of @p n carbon atoms each
Molecule twoCarbonRings(unsigned n);
//! Carbon atoms at the corners of a cube, single bonds along the edges
Molecule cubane();

/* Fixture restoring Options::Matching::deduplication after a test changes
 * it
 */
struct DeduplicationFixture {
  DeduplicationFixture() : previous(Options::Matching::deduplication) {}
  ~DeduplicationFixture() {
    Options::Matching::deduplication = previous;
  }

  MappingDeduplication previous;
};

} // namespace Fixtures
} // namespace Chemgraph
} // namespace Scine

#endif
