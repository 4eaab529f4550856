/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Fixtures.h"

namespace Scine {
namespace Chemgraph {
namespace Fixtures {

using Utils::ElementType;

Molecule carbonPair() {
  return Molecule {
    {Atom {ElementType::C}, Atom {ElementType::C}},
    {{0, 1, BondType::Double}}
  };
}

Molecule ethane() {
  Molecule ethane;
  ethane.addAtom(Atom {ElementType::C});
  ethane.addAtom(Atom {ElementType::C});
  ethane.addBond(0, 1);
  for(AtomIndex carbon = 0; carbon < 2; ++carbon) {
    for(unsigned i = 0; i < 3; ++i) {
      const AtomIndex hydrogen = ethane.addAtom(Atom {ElementType::H});
      ethane.addBond(carbon, hydrogen);
    }
  }
  return ethane;
}

Molecule ethylene() {
  Molecule ethylene = carbonPair();
  for(AtomIndex carbon = 0; carbon < 2; ++carbon) {
    for(unsigned i = 0; i < 2; ++i) {
      const AtomIndex hydrogen = ethylene.addAtom(Atom {ElementType::H});
      ethylene.addBond(carbon, hydrogen);
    }
  }
  return ethylene;
}

Molecule formaldehyde() {
  return Molecule {
    {
      Atom {ElementType::C},
      Atom {ElementType::O, 0, 0, 2},
      Atom {ElementType::H},
      Atom {ElementType::H}
    },
    {
      {0, 1, BondType::Double},
      {0, 2, BondType::Single},
      {0, 3, BondType::Single}
    }
  };
}

Molecule methane() {
  Molecule methane;
  methane.addAtom(Atom {ElementType::C});
  for(unsigned i = 0; i < 4; ++i) {
    methane.addBond(0, methane.addAtom(Atom {ElementType::H}));
  }
  return methane;
}

Molecule aromaticBenzene() {
  Molecule benzene;
  for(unsigned i = 0; i < 6; ++i) {
    benzene.addAtom(Atom {ElementType::C});
  }
  for(AtomIndex i = 0; i < 6; ++i) {
    benzene.addBond(i, (i + 1) % 6, BondType::Aromatic);
  }
  return benzene;
}

Molecule kekuleBenzene() {
  Molecule benzene;
  for(unsigned i = 0; i < 6; ++i) {
    benzene.addAtom(Atom {ElementType::C});
  }
  for(AtomIndex i = 0; i < 6; ++i) {
    benzene.addBond(
      i,
      (i + 1) % 6,
      (i % 2 == 0) ? BondType::Double : BondType::Single
    );
  }
  return benzene;
}

Molecule naphthalene() {
  /* 0 - 1 - 2 - 3 - 4 - 5 - 0 is the first ring, 4 - 6 - 7 - 8 - 9 - 5 closes
   * the second ring over the shared bond 4 - 5
   */
  Molecule naphthalene;
  for(unsigned i = 0; i < 10; ++i) {
    naphthalene.addAtom(Atom {ElementType::C});
  }
  for(AtomIndex i = 0; i < 6; ++i) {
    naphthalene.addBond(i, (i + 1) % 6, BondType::Aromatic);
  }
  naphthalene.addBond(4, 6, BondType::Aromatic);
  naphthalene.addBond(6, 7, BondType::Aromatic);
  naphthalene.addBond(7, 8, BondType::Aromatic);
  naphthalene.addBond(8, 9, BondType::Aromatic);
  naphthalene.addBond(9, 5, BondType::Aromatic);
  return naphthalene;
}

Molecule carbonRing(const unsigned n) {
  Molecule ring;
  for(unsigned i = 0; i < n; ++i) {
    ring.addAtom(Atom {ElementType::C});
  }
  for(AtomIndex i = 0; i < n; ++i) {
    ring.addBond(i, (i + 1) % n);
  }
  return ring;
}

Molecule twoCarbonRings(const unsigned n) {
  Molecule rings = carbonRing(n);
  rings.merge(carbonRing(n));
  return rings;
}

Molecule cubane() {
  Molecule cube;
  for(unsigned i = 0; i < 8; ++i) {
    cube.addAtom(Atom {ElementType::C});
  }
  // Corners are bit triples, edges join corners differing in one bit
  for(AtomIndex i = 0; i < 8; ++i) {
    for(AtomIndex bit = 1; bit < 8; bit <<= 1) {
      const AtomIndex j = i ^ bit;
      if(i < j) {
        cube.addBond(i, j);
      }
    }
  }
  return cube;
}

} // namespace Fixtures
} // namespace Chemgraph
} // namespace Scine
