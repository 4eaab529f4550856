/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "boost/test/unit_test.hpp"

#include "Chemgraph/Group.h"
#include "Chemgraph/Molecule.h"

#include "Fixtures.h"

using namespace Scine;
using namespace Chemgraph;

namespace {

//! Carbon with exactly one double bond, to any atom
Group carbonylLike() {
  return Group {
    {
      GroupAtom {AtomTypeSet {AtomType::Cd, AtomType::CO}},
      GroupAtom {AtomTypeSet {AtomType::R}}
    },
    {{0, 1, GroupBond {BondType::Double}}}
  };
}

} // namespace

BOOST_AUTO_TEST_CASE(GroupConstruction, *boost::unit_test::label("Chemgraph")) {
  const Group group = carbonylLike();
  BOOST_CHECK_EQUAL(group.V(), 2);
  BOOST_CHECK_EQUAL(group.E(), 1);
  BOOST_CHECK(group.adjacent(1, 0));
  BOOST_CHECK(group.labelsOf(BondIndex {0, 1}).matches(BondType::Double));
  BOOST_CHECK(group.labelsOf(0).atomTypes.isSet(AtomType::CO));
  BOOST_CHECK_THROW(group.atom(2), std::out_of_range);

  BOOST_CHECK_THROW(
    Group({GroupAtom {}}, {}),
    EmptyLabelSet
  );
  BOOST_CHECK_THROW(
    Group(
      {GroupAtom {AtomTypeSet {AtomType::C}}, GroupAtom {AtomTypeSet {AtomType::C}}},
      {{0, 1, GroupBond {}}}
    ),
    EmptyLabelSet
  );
  BOOST_CHECK_THROW(
    Group(
      {GroupAtom {AtomTypeSet {AtomType::C}}},
      {{0, 1, GroupBond::anyBond()}}
    ),
    UnknownVertex
  );
  BOOST_CHECK_THROW(
    Group(
      {GroupAtom {AtomTypeSet {AtomType::C}}, GroupAtom {AtomTypeSet {AtomType::C}}},
      {{0, 1, GroupBond::anyBond()}, {1, 0, GroupBond {BondType::Single}}}
    ),
    DuplicateEdge
  );

  const Group copy = group.clone();
  BOOST_CHECK(copy.atom(0) == group.atom(0));
  BOOST_CHECK(copy.edges() == group.edges());
}

BOOST_AUTO_TEST_CASE(GroupAtomMembership, *boost::unit_test::label("Chemgraph")) {
  const Atom carbon {Utils::ElementType::C};
  const GroupAtom anyCarbon {AtomTypeSet {AtomType::C}};
  BOOST_CHECK(matchesLabel(anyCarbon, carbon, AtomType::Cd));
  BOOST_CHECK(matchesLabel(anyCarbon, carbon, AtomType::Cs));
  BOOST_CHECK(!matchesLabel(anyCarbon, Atom {Utils::ElementType::O}, AtomType::Os));

  const GroupAtom singleBonded {AtomTypeSet {AtomType::Cs}};
  BOOST_CHECK(!matchesLabel(singleBonded, carbon, AtomType::Cd));

  // Empty property lists are unconstrained, listed ones restrict
  const GroupAtom carbonRadical {AtomTypeSet {AtomType::C}, {1, 2}};
  BOOST_CHECK(!matchesLabel(carbonRadical, carbon, AtomType::Cs));
  BOOST_CHECK(matchesLabel(carbonRadical, Atom {Utils::ElementType::C, 1}, AtomType::Cs));
  BOOST_CHECK(matchesLabel(carbonRadical, Atom {Utils::ElementType::C, 2, -1}, AtomType::Cs));

  const GroupAtom anion {AtomTypeSet {AtomType::R}, {}, {-1}};
  BOOST_CHECK(matchesLabel(anion, Atom {Utils::ElementType::O, 0, -1, 3}, AtomType::Os));
  BOOST_CHECK(!matchesLabel(anion, Atom {Utils::ElementType::O, 0, 0, 2}, AtomType::Os));

  const GroupAtom pairs {AtomTypeSet {AtomType::O}, {}, {}, {2}};
  BOOST_CHECK(matchesLabel(pairs, Atom {Utils::ElementType::O, 0, 0, 2}, AtomType::Od));
  BOOST_CHECK(!matchesLabel(pairs, Atom {Utils::ElementType::O, 0, -1, 3}, AtomType::Os));
}

BOOST_AUTO_TEST_CASE(GroupBondMembership, *boost::unit_test::label("Chemgraph")) {
  const GroupBond single {BondType::Single};
  BOOST_CHECK(matchesLabel(single, BondType::Single));
  BOOST_CHECK(!matchesLabel(single, BondType::Aromatic));

  const GroupBond singleOrDouble {GroupBond::OrderSet {BondType::Single, BondType::Double}};
  BOOST_CHECK(matchesLabel(singleOrDouble, BondType::Double));
  BOOST_CHECK(!matchesLabel(singleOrDouble, BondType::Triple));

  const GroupBond any = GroupBond::anyBond();
  for(unsigned i = 0; i < nBondTypes; ++i) {
    BOOST_CHECK(matchesLabel(any, static_cast<BondType>(i)));
  }
  BOOST_CHECK(!any.empty());
  BOOST_CHECK(GroupBond {}.empty());
}

BOOST_AUTO_TEST_CASE(GroupBondEquality, *boost::unit_test::label("Chemgraph")) {
  const GroupBond any = GroupBond::anyBond();
  const GroupBond allOrders {
    GroupBond::OrderSet {BondType::Single, BondType::Double, BondType::Triple, BondType::Aromatic}
  };
  BOOST_CHECK(any == allOrders);
  BOOST_CHECK(allOrders == any);
  BOOST_CHECK(any.accepted() == allOrders.orders);
  BOOST_CHECK(any.isSpecificCaseOf(allOrders));
  BOOST_CHECK(allOrders.isSpecificCaseOf(any));

  const GroupBond threeOrders {
    GroupBond::OrderSet {BondType::Single, BondType::Double, BondType::Triple}
  };
  BOOST_CHECK(any != threeOrders);
  BOOST_CHECK(threeOrders.isSpecificCaseOf(any));
  BOOST_CHECK(!any.isSpecificCaseOf(threeOrders));
}

BOOST_AUTO_TEST_CASE(LabelSpecialization, *boost::unit_test::label("Chemgraph")) {
  const GroupAtom carbonyl {AtomTypeSet {AtomType::CO}};
  const GroupAtom doubleBonded {AtomTypeSet {AtomType::Cd, AtomType::CO}};
  const GroupAtom anyCarbon {AtomTypeSet {AtomType::C}};
  BOOST_CHECK(carbonyl.isSpecificCaseOf(doubleBonded));
  BOOST_CHECK(doubleBonded.isSpecificCaseOf(anyCarbon));
  BOOST_CHECK(!anyCarbon.isSpecificCaseOf(doubleBonded));
  BOOST_CHECK(carbonyl.isSpecificCaseOf(carbonyl));

  const GroupAtom radical {AtomTypeSet {AtomType::C}, {1}};
  const GroupAtom someRadical {AtomTypeSet {AtomType::C}, {1, 2}};
  BOOST_CHECK(radical.isSpecificCaseOf(someRadical));
  BOOST_CHECK(radical.isSpecificCaseOf(anyCarbon));
  BOOST_CHECK(!someRadical.isSpecificCaseOf(radical));
  BOOST_CHECK(!anyCarbon.isSpecificCaseOf(radical));

  const GroupBond single {BondType::Single};
  const GroupBond singleOrDouble {GroupBond::OrderSet {BondType::Single, BondType::Double}};
  BOOST_CHECK(single.isSpecificCaseOf(singleOrDouble));
  BOOST_CHECK(!singleOrDouble.isSpecificCaseOf(single));
  BOOST_CHECK(singleOrDouble.isSpecificCaseOf(GroupBond::anyBond()));
  BOOST_CHECK(!GroupBond::anyBond().isSpecificCaseOf(singleOrDouble));

  // Labels are not part of equivalence, but of equality
  const GroupAtom labeled {AtomTypeSet {AtomType::CO}, {}, {}, {}, "*1"};
  BOOST_CHECK(labeled.equivalent(carbonyl));
  BOOST_CHECK(labeled != carbonyl);
}

BOOST_AUTO_TEST_CASE(GroupSpecialization, *boost::unit_test::label("Chemgraph")) {
  const Group generic {
    {GroupAtom {AtomTypeSet {AtomType::C}}, GroupAtom {AtomTypeSet {AtomType::R}}},
    {{0, 1, GroupBond::anyBond()}}
  };
  const Group carbonyl {
    {GroupAtom {AtomTypeSet {AtomType::CO}}, GroupAtom {AtomTypeSet {AtomType::Od}}},
    {{0, 1, GroupBond {BondType::Double}}}
  };

  BOOST_CHECK(carbonyl.isSpecificCaseOf(generic));
  BOOST_CHECK(!generic.isSpecificCaseOf(carbonyl));
  BOOST_CHECK(carbonylLike().isSpecificCaseOf(generic));
  BOOST_CHECK(carbonyl.isSpecificCaseOf(carbonylLike()));
  BOOST_CHECK(carbonyl.isSpecificCaseOf(carbonyl));
}

BOOST_AUTO_TEST_CASE(GroupLabels, *boost::unit_test::label("Chemgraph")) {
  const Group group {
    {
      GroupAtom {AtomTypeSet {AtomType::C}, {}, {}, {}, "*1"},
      GroupAtom {AtomTypeSet {AtomType::H}, {}, {}, {}, "*2"},
      GroupAtom {AtomTypeSet {AtomType::R}}
    },
    {{0, 1, GroupBond {BondType::Single}}, {0, 2, GroupBond::anyBond()}}
  };

  const auto labels = group.labeledAtoms();
  BOOST_REQUIRE_EQUAL(labels.size(), 2);
  BOOST_CHECK((labels.at("*2") == std::vector<AtomIndex> {1}));
}
