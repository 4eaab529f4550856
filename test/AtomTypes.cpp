/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "boost/test/unit_test.hpp"

#include "Chemgraph/AtomTypes.h"
#include "Chemgraph/Molecule.h"

#include "Fixtures.h"

using namespace Scine;
using namespace Chemgraph;

BOOST_AUTO_TEST_CASE(AtomTypePerception, *boost::unit_test::label("Chemgraph")) {
  const Molecule ethane = Fixtures::ethane();
  BOOST_CHECK(ethane.atomType(0) == AtomType::Cs);
  BOOST_CHECK(ethane.atomType(2) == AtomType::H);

  const Molecule formaldehyde = Fixtures::formaldehyde();
  BOOST_CHECK(formaldehyde.atomType(0) == AtomType::CO);
  BOOST_CHECK(formaldehyde.atomType(1) == AtomType::Od);

  BOOST_CHECK(Fixtures::ethylene().atomType(1) == AtomType::Cd);
  BOOST_CHECK(Fixtures::carbonPair().atomType(0) == AtomType::Cd);
  BOOST_CHECK(Fixtures::aromaticBenzene().atomType(0) == AtomType::Cb);
  BOOST_CHECK(Fixtures::naphthalene().atomType(4) == AtomType::Cbf);
  BOOST_CHECK(Fixtures::naphthalene().atomType(0) == AtomType::Cb);

  // Carbon dioxide
  const Molecule dioxide {
    {
      Atom {Utils::ElementType::O},
      Atom {Utils::ElementType::C},
      Atom {Utils::ElementType::O}
    },
    {{0, 1, BondType::Double}, {1, 2, BondType::Double}}
  };
  BOOST_CHECK(dioxide.atomType(1) == AtomType::Cdd);
  BOOST_CHECK(dioxide.atomType(0) == AtomType::Od);

  // Isolated oxygen and isotopes
  BOOST_CHECK(perceiveAtomType(Utils::ElementType::O, BondCounts {}) == AtomType::Oa);
  BOOST_CHECK(perceiveAtomType(Utils::ElementType::D, BondCounts {}) == AtomType::H);
  BOOST_CHECK(perceiveAtomType(Utils::ElementType::Cl, BondCounts {}) == AtomType::RnotH);

  BondCounts acetylenic;
  acetylenic.single = 1;
  acetylenic.triple = 1;
  BOOST_CHECK(perceiveAtomType(Utils::ElementType::C, acetylenic) == AtomType::Ct);
  BOOST_CHECK(perceiveAtomType(Utils::ElementType::Si, acetylenic) == AtomType::Sit);
  BOOST_CHECK(perceiveAtomType(Utils::ElementType::N, acetylenic) == AtomType::N);

  BondCounts thione;
  thione.single = 0;
  thione.doubles = 1;
  BOOST_CHECK(perceiveAtomType(Utils::ElementType::S, thione) == AtomType::Sd);
  BOOST_CHECK(perceiveAtomType(Utils::ElementType::Si, thione) == AtomType::Sid);
  thione.doublesToOxygen = 1;
  BOOST_CHECK(perceiveAtomType(Utils::ElementType::Si, thione) == AtomType::SiO);
}

BOOST_AUTO_TEST_CASE(AtomTypeHierarchy, *boost::unit_test::label("Chemgraph")) {
  BOOST_CHECK(isSpecificCaseOf(AtomType::Cd, AtomType::Cd));
  BOOST_CHECK(isSpecificCaseOf(AtomType::Cd, AtomType::C));
  BOOST_CHECK(isSpecificCaseOf(AtomType::Cd, AtomType::RnotH));
  BOOST_CHECK(isSpecificCaseOf(AtomType::Cd, AtomType::R));
  BOOST_CHECK(isSpecificCaseOf(AtomType::H, AtomType::R));
  BOOST_CHECK(!isSpecificCaseOf(AtomType::H, AtomType::RnotH));
  BOOST_CHECK(!isSpecificCaseOf(AtomType::Cd, AtomType::CO));
  BOOST_CHECK(!isSpecificCaseOf(AtomType::C, AtomType::Cd));
  BOOST_CHECK(!isSpecificCaseOf(AtomType::R, AtomType::C));
  BOOST_CHECK(parent(AtomType::R) == AtomType::R);
  BOOST_CHECK(parent(AtomType::Sibf) == AtomType::Si);

  const AtomTypeSet doubleBonded {AtomType::Cd, AtomType::CO};
  BOOST_CHECK(isSpecificCaseOf(AtomType::CO, doubleBonded));
  BOOST_CHECK(!isSpecificCaseOf(AtomType::Cs, doubleBonded));
  BOOST_CHECK(!isSpecificCaseOf(AtomType::C, doubleBonded));
  BOOST_CHECK(isSpecificCaseOf(AtomType::Od, AtomTypeSet {AtomType::RnotH}));

  // Every type is a specific case of R, and of its own parent chain
  for(unsigned i = 0; i < nAtomTypes; ++i) {
    const auto type = static_cast<AtomType>(i);
    BOOST_CHECK(isSpecificCaseOf(type, AtomType::R));
    BOOST_CHECK(isSpecificCaseOf(type, parent(type)));
    BOOST_CHECK(!name(type).empty());
  }

  BOOST_CHECK_EQUAL(name(AtomType::RnotH), "R!H");
  BOOST_CHECK_EQUAL(name(AtomType::Cbf), "Cbf");
}
