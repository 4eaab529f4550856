/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/Group.h"

#include "Chemgraph/Molecule.h"
#include "Chemgraph/Options.h"
#include "Chemgraph/Subgraphs.h"
#include "Chemgraph/Temple/Functional.h"

#include <tuple>

namespace Scine {
namespace Chemgraph {
namespace {

//! Empty lists place no constraint
template<typename T>
bool listed(const std::vector<T>& acceptable, const T& value) {
  return acceptable.empty() || Temple::makeContainsPredicate(acceptable)(value);
}

//! Whether a constraint list is at least as strict as another
template<typename T>
bool atLeastAsStrict(const std::vector<T>& constraint, const std::vector<T>& other) {
  if(other.empty()) {
    return true;
  }

  if(constraint.empty()) {
    return false;
  }

  return Temple::all_of(constraint, Temple::makeContainsPredicate(other));
}

template<typename T>
bool sameSet(const std::vector<T>& a, const std::vector<T>& b) {
  return Temple::sorted(a) == Temple::sorted(b);
}

} // namespace

GroupAtom::GroupAtom(
  const AtomTypeSet types,
  std::vector<unsigned> radicals,
  std::vector<int> atomCharges,
  std::vector<unsigned> pairs,
  std::string role
) : atomTypes(types),
    radicalElectrons(std::move(radicals)),
    charges(std::move(atomCharges)),
    lonePairs(std::move(pairs)),
    label(std::move(role))
{}

bool GroupAtom::matches(const Atom& atom, const AtomType type) const {
  return (
    Chemgraph::isSpecificCaseOf(type, atomTypes)
    && listed(radicalElectrons, atom.radicalElectrons)
    && listed(charges, atom.charge)
    && listed(lonePairs, atom.lonePairs)
  );
}

bool GroupAtom::isSpecificCaseOf(const GroupAtom& other) const {
  const bool typesCovered = Temple::all_of(
    atomTypes.values(),
    [&](const AtomType type) {
      return Chemgraph::isSpecificCaseOf(type, other.atomTypes);
    }
  );

  return (
    typesCovered
    && atLeastAsStrict(radicalElectrons, other.radicalElectrons)
    && atLeastAsStrict(charges, other.charges)
    && atLeastAsStrict(lonePairs, other.lonePairs)
  );
}

bool GroupAtom::equivalent(const GroupAtom& other) const {
  return (
    atomTypes == other.atomTypes
    && sameSet(radicalElectrons, other.radicalElectrons)
    && sameSet(charges, other.charges)
    && sameSet(lonePairs, other.lonePairs)
  );
}

bool GroupAtom::operator == (const GroupAtom& other) const {
  return equivalent(other) && label == other.label;
}

bool GroupAtom::operator != (const GroupAtom& other) const {
  return !(*this == other);
}

GroupBond::GroupBond(const OrderSet acceptable) : orders(acceptable) {}

GroupBond::GroupBond(const BondType order) : orders(order) {}

GroupBond GroupBond::anyBond() {
  GroupBond bond;
  bond.any = true;
  return bond;
}

bool GroupBond::empty() const {
  return !any && orders.empty();
}

bool GroupBond::matches(const BondType order) const {
  return any || orders.isSet(order);
}

GroupBond::OrderSet GroupBond::accepted() const {
  if(any) {
    return OrderSet {BondType::Single, BondType::Double, BondType::Triple, BondType::Aromatic};
  }

  return orders;
}

bool GroupBond::isSpecificCaseOf(const GroupBond& other) const {
  return accepted().isSubsetOf(other.accepted());
}

bool GroupBond::operator == (const GroupBond& other) const {
  return accepted() == other.accepted();
}

bool GroupBond::operator != (const GroupBond& other) const {
  return !(*this == other);
}

bool matchesLabel(const GroupAtom& groupAtom, const Atom& atom, const AtomType type) {
  return groupAtom.matches(atom, type);
}

bool matchesLabel(const GroupBond& groupBond, const BondType order) {
  return groupBond.matches(order);
}

Group::Group() = default;

Group::Group(
  const std::vector<GroupAtom>& atoms,
  const std::vector<GroupBondRecord>& bonds
) {
  for(const GroupAtom& atom : atoms) {
    if(atom.atomTypes.empty()) {
      throw EmptyLabelSet(
        "Group atom " + std::to_string(graph_.V()) + " lists no atom types"
      );
    }
    graph_.addVertex(atom);
  }

  for(const GroupBondRecord& record : bonds) {
    if(record.bond.empty()) {
      throw EmptyLabelSet(
        "Group bond between " + std::to_string(record.first) + " and "
        + std::to_string(record.second) + " lists no bond orders"
      );
    }
    graph_.addEdge(record.first, record.second, record.bond);
  }
}

AtomIndex Group::V() const {
  return graph_.V();
}

std::size_t Group::E() const {
  return graph_.E();
}

Group::VertexRange Group::vertices() const {
  return graph_.vertices();
}

std::vector<BondIndex> Group::edges() const {
  std::vector<BondIndex> bonds;
  bonds.reserve(graph_.E());
  for(const auto& e : graph_.edges()) {
    bonds.push_back(graph_.bondIndex(e));
  }
  Temple::sort(bonds);
  return bonds;
}

const GroupAtom& Group::atom(const AtomIndex i) const {
  return graph_.label(i);
}

const GroupAtom& Group::labelsOf(const AtomIndex i) const {
  return atom(i);
}

const GroupBond& Group::bond(const BondIndex& bond) const {
  return graph_.label(graph_.edge(bond.first, bond.second));
}

const GroupBond& Group::labelsOf(const BondIndex& bond) const {
  return this->bond(bond);
}

bool Group::adjacent(const AtomIndex i, const AtomIndex j) const {
  return graph_.adjacent(i, j);
}

std::vector<AtomIndex> Group::neighbors(const AtomIndex i) const {
  return graph_.neighbors(i);
}

unsigned Group::degree(const AtomIndex i) const {
  return graph_.degree(i);
}

std::map<std::string, std::vector<AtomIndex>> Group::labeledAtoms() const {
  std::map<std::string, std::vector<AtomIndex>> labeled;
  for(const AtomIndex i : vertices()) {
    const std::string& label = atom(i).label;
    if(!label.empty()) {
      labeled[label].push_back(i);
    }
  }
  return labeled;
}

Group Group::clone() const {
  return *this;
}

const Group::GraphType& Group::graph() const {
  return graph_;
}

bool Group::isSpecificCaseOf(const Group& other) const {
  return static_cast<bool>(
    Subgraphs::subgraph(other, *this, Options::Matching::defaultBound).value()
  );
}

} // namespace Chemgraph
} // namespace Scine
