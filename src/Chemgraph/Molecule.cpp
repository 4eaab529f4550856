/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/Molecule.h"

#include "Chemgraph/Cycles.h"
#include "Chemgraph/Group.h"
#include "Chemgraph/Options.h"
#include "Chemgraph/Subgraphs.h"
#include "Chemgraph/Temple/Functional.h"

#include "Utils/Geometry/ElementInfo.h"

#include <tuple>

namespace Scine {
namespace Chemgraph {
namespace {

void throwIfNoElement(const Atom& atom) {
  if(atom.element == Utils::ElementType::none) {
    throw EmptyLabelSet("Atoms must have an element type");
  }
}

//! Element type without isotope information
Utils::ElementType baseElement(const Utils::ElementType e) {
  return Utils::ElementInfo::element(Utils::ElementInfo::Z(e));
}

} // namespace

Atom::Atom(
  const Utils::ElementType e,
  const unsigned radicals,
  const int atomCharge,
  const unsigned pairs,
  std::string role
) : element(e),
    radicalElectrons(radicals),
    charge(atomCharge),
    lonePairs(pairs),
    label(std::move(role))
{}

bool Atom::equivalent(const Atom& other) const {
  return (
    std::tie(element, radicalElectrons, charge, lonePairs)
    == std::tie(other.element, other.radicalElectrons, other.charge, other.lonePairs)
  );
}

bool Atom::operator == (const Atom& other) const {
  return equivalent(other) && label == other.label;
}

bool Atom::operator != (const Atom& other) const {
  return !(*this == other);
}

Molecule::Molecule() = default;

Molecule::Molecule(GraphType graph) : graph_(std::move(graph)) {}

Molecule::Molecule(
  const std::vector<Atom>& atoms,
  const std::vector<BondRecord>& bonds
) {
  for(const Atom& atom : atoms) {
    addAtom(atom);
  }

  for(const BondRecord& record : bonds) {
    addBond(record.first, record.second, record.type);
  }
}

AtomIndex Molecule::addAtom(const Atom& atom) {
  throwIfNoElement(atom);
  return graph_.addVertex(atom);
}

BondIndex Molecule::addBond(const AtomIndex i, const AtomIndex j, const BondType type) {
  graph_.addEdge(i, j, type);
  return {i, j};
}

void Molecule::removeAtom(const AtomIndex i) {
  graph_.removeVertex(i);
}

void Molecule::removeBond(const BondIndex& bond) {
  graph_.removeEdge(bond.first, bond.second);
}

void Molecule::setBondType(const BondIndex& bond, const BondType type) {
  graph_.label(graph_.edge(bond.first, bond.second)) = type;
}

void Molecule::setAtom(const AtomIndex i, const Atom& atom) {
  Atom& stored = graph_.label(i);
  throwIfNoElement(atom);
  stored = atom;
}

std::vector<AtomIndex> Molecule::merge(const Molecule& other) {
  return graph_.merge(other.graph_);
}

AtomIndex Molecule::V() const {
  return graph_.V();
}

std::size_t Molecule::E() const {
  return graph_.E();
}

Molecule::VertexRange Molecule::vertices() const {
  return graph_.vertices();
}

std::vector<BondIndex> Molecule::edges() const {
  std::vector<BondIndex> bonds;
  bonds.reserve(graph_.E());
  for(const auto& e : graph_.edges()) {
    bonds.push_back(graph_.bondIndex(e));
  }
  Temple::sort(bonds);
  return bonds;
}

const Atom& Molecule::atom(const AtomIndex i) const {
  return graph_.label(i);
}

const Atom& Molecule::labelsOf(const AtomIndex i) const {
  return atom(i);
}

BondType Molecule::bondType(const BondIndex& bond) const {
  return graph_.label(graph_.edge(bond.first, bond.second));
}

BondType Molecule::labelsOf(const BondIndex& bond) const {
  return bondType(bond);
}

bool Molecule::adjacent(const AtomIndex i, const AtomIndex j) const {
  return graph_.adjacent(i, j);
}

std::vector<AtomIndex> Molecule::neighbors(const AtomIndex i) const {
  return graph_.neighbors(i);
}

unsigned Molecule::degree(const AtomIndex i) const {
  return graph_.degree(i);
}

Molecule Molecule::clone() const {
  return Molecule {graph_};
}

const Molecule::GraphType& Molecule::graph() const {
  return graph_;
}

BondCounts Molecule::bondCounts(const AtomIndex i) const {
  BondCounts counts;
  for(const auto& e : graph_.edges(i)) {
    switch(graph_.label(e)) {
      case BondType::Single:
        ++counts.single;
        break;
      case BondType::Double: {
        ++counts.doubles;
        const AtomIndex j = graph_.bondIndex(e).other(i);
        if(baseElement(atom(j).element) == Utils::ElementType::O) {
          ++counts.doublesToOxygen;
        }
        break;
      }
      case BondType::Triple:
        ++counts.triple;
        break;
      case BondType::Aromatic:
        ++counts.aromatic;
        break;
    }
  }
  return counts;
}

AtomType Molecule::atomType(const AtomIndex i) const {
  return perceiveAtomType(atom(i).element, bondCounts(i));
}

std::vector<AtomType> Molecule::atomTypes() const {
  return Temple::map(
    vertices(),
    [&](const AtomIndex i) { return atomType(i); }
  );
}

std::string Molecule::formula() const {
  std::map<std::string, unsigned> counts;
  for(const AtomIndex i : vertices()) {
    ++counts[Utils::ElementInfo::symbol(baseElement(atom(i).element))];
  }

  std::string hill;
  auto append = [&](const std::string& symbol, const unsigned count) {
    hill += symbol;
    if(count > 1) {
      hill += std::to_string(count);
    }
  };

  const auto carbonIter = counts.find("C");
  if(carbonIter != std::end(counts)) {
    append(carbonIter->first, carbonIter->second);
    counts.erase(carbonIter);
    const auto hydrogenIter = counts.find("H");
    if(hydrogenIter != std::end(counts)) {
      append(hydrogenIter->first, hydrogenIter->second);
      counts.erase(hydrogenIter);
    }
  }

  // std::map iterates alphabetically
  for(const auto& symbolCountPair : counts) {
    append(symbolCountPair.first, symbolCountPair.second);
  }

  return hill;
}

double Molecule::molecularWeight() const {
  return Temple::accumulate(
    vertices(),
    0.0,
    [&](const double carry, const AtomIndex i) {
      return carry + Utils::ElementInfo::mass(atom(i).element);
    }
  );
}

unsigned Molecule::radicalCount() const {
  return Temple::accumulate(
    vertices(),
    0u,
    [&](const unsigned carry, const AtomIndex i) {
      return carry + atom(i).radicalElectrons;
    }
  );
}

bool Molecule::isRadical() const {
  return radicalCount() > 0;
}

int Molecule::charge() const {
  return Temple::accumulate(
    vertices(),
    0,
    [&](const int carry, const AtomIndex i) {
      return carry + atom(i).charge;
    }
  );
}

std::map<std::string, std::vector<AtomIndex>> Molecule::labeledAtoms() const {
  std::map<std::string, std::vector<AtomIndex>> labeled;
  for(const AtomIndex i : vertices()) {
    const std::string& label = atom(i).label;
    if(!label.empty()) {
      labeled[label].push_back(i);
    }
  }
  return labeled;
}

bool Molecule::isCyclic() const {
  return Chemgraph::isCyclic(graph_);
}

bool Molecule::isAtomInCycle(const AtomIndex i) const {
  return isVertexInCycle(graph_, i);
}

bool Molecule::isBondInCycle(const BondIndex& bond) const {
  return isEdgeInCycle(graph_, bond.first, bond.second);
}

std::vector<Ring> Molecule::sssr() const {
  return Chemgraph::sssr(graph_);
}

bool Molecule::isConnected() const {
  return graph_.isConnected();
}

std::vector<std::vector<AtomIndex>> Molecule::connectedComponents() const {
  return graph_.connectedComponents();
}

std::vector<Molecule> Molecule::split() const {
  std::vector<Molecule> parts;
  for(auto& componentPair : graph_.split()) {
    parts.push_back(Molecule {std::move(componentPair.first)});
  }
  return parts;
}

bool Molecule::isIsomorphic(const Molecule& other) const {
  return static_cast<bool>(findIsomorphism(other));
}

boost::optional<IndexMap> Molecule::findIsomorphism(const Molecule& other) const {
  return Subgraphs::isomorphism(*this, other, Options::Matching::defaultBound).value();
}

bool Molecule::isSubgraphIsomorphic(const Group& group) const {
  return static_cast<bool>(
    Subgraphs::subgraph(group, *this, Options::Matching::defaultBound).value()
  );
}

std::vector<IndexMap> Molecule::findSubgraphIsomorphisms(const Group& group) const {
  return Subgraphs::subgraphs(group, *this, Options::Matching::defaultBound).value();
}

} // namespace Chemgraph
} // namespace Scine
