/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Wildcard chemical graph used as a structural pattern
 */

#ifndef INCLUDE_CHEMGRAPH_GROUP_H
#define INCLUDE_CHEMGRAPH_GROUP_H

#include "Chemgraph/AtomTypes.h"
#include "Chemgraph/Graph/LabeledGraph.h"

#include <map>
#include <string>
#include <vector>

namespace Scine {
namespace Chemgraph {

// Forward-declarations
struct Atom;

/**
 * @brief Set of acceptable atom states, the vertex label of groups
 *
 * An atom matches if its perceived atom type is a specific case of any of the
 * listed atom types and its radical electron count, charge and lone pair count
 * are each listed. An empty list of radical electron counts, charges or lone
 * pairs places no constraint on that property.
 */
struct CHEMGRAPH_EXPORT GroupAtom {
  //! Acceptable atom types, must not be empty
  AtomTypeSet atomTypes;
  //! Acceptable radical electron counts, any if empty
  std::vector<unsigned> radicalElectrons;
  //! Acceptable charges, any if empty
  std::vector<int> charges;
  //! Acceptable lone pair counts, any if empty
  std::vector<unsigned> lonePairs;
  //! Role of the atom in a reaction template, e.g. "*1". Empty if none.
  std::string label;

  GroupAtom() = default;
  explicit GroupAtom(
    AtomTypeSet types,
    std::vector<unsigned> radicals = {},
    std::vector<int> atomCharges = {},
    std::vector<unsigned> pairs = {},
    std::string role = ""
  );

  //! Whether a concrete atom with a perceived atom type is acceptable
  bool matches(const Atom& atom, AtomType type) const;

  /*! @brief Whether every atom state acceptable here is acceptable to @p other
   *
   * Each atom type must be a specific case of one of the other's atom types.
   * Where the other constrains radical electrons, charges or lone pairs, this
   * must constrain them to a subset.
   */
  bool isSpecificCaseOf(const GroupAtom& other) const;

  //! Whether all constraints are equal, ignoring the label
  bool equivalent(const GroupAtom& other) const;

  //! Equivalence including the label
  bool operator == (const GroupAtom& other) const;
  bool operator != (const GroupAtom& other) const;
};

/**
 * @brief Set of acceptable bond orders, the edge label of groups
 *
 * Either a non-empty set of bond orders or the "any bond" wildcard, which
 * accepts every bond order.
 */
struct CHEMGRAPH_EXPORT GroupBond {
  //! Set of bond orders
  using OrderSet = Temple::Bitmask<BondType>;

  OrderSet orders;
  //! Whether every bond order is acceptable
  bool any = false;

  GroupBond() = default;
  //! Set of acceptable bond orders
  explicit GroupBond(OrderSet acceptable);
  //! Single bond order
  explicit GroupBond(BondType order);

  //! Wildcard accepting all bond orders
  static GroupBond anyBond();

  //! Whether no bond order is acceptable
  bool empty() const;

  //! Whether a concrete bond order is acceptable
  bool matches(BondType order) const;

  //! All acceptable bond orders, every order for the wildcard
  OrderSet accepted() const;

  //! Whether every bond order acceptable here is acceptable to @p other
  bool isSpecificCaseOf(const GroupBond& other) const;

  //! Equality of the acceptable bond orders
  bool operator == (const GroupBond& other) const;
  bool operator != (const GroupBond& other) const;
};

/*! @brief Vertex compatibility primitive of pattern matching
 *
 * @complexity{@math{O(\textrm{depth} + R + C + L)}}
 */
CHEMGRAPH_EXPORT bool matchesLabel(const GroupAtom& groupAtom, const Atom& atom, AtomType type);

/*! @brief Edge compatibility primitive of pattern matching
 *
 * @complexity{@math{\Theta(1)}}
 */
CHEMGRAPH_EXPORT bool matchesLabel(const GroupBond& groupBond, BondType order);

//! Atom pair and acceptable bond orders of a group bond
struct CHEMGRAPH_EXPORT GroupBondRecord {
  AtomIndex first;
  AtomIndex second;
  GroupBond bond;
};

/**
 * @brief Wildcard chemical graph
 *
 * Atoms and bonds carry sets of acceptable labels. Groups are authored once
 * and then only read. No modifying member functions exist, so a group may be
 * matched against molecules from any number of threads at once.
 */
class CHEMGRAPH_EXPORT Group {
public:
//!@name Member types
//!@{
  using GraphType = LabeledGraph<GroupAtom, GroupBond>;
  using VertexRange = GraphType::VertexRange;
//!@}

//!@name Constructors
//!@{
  //! Empty group
  Group();

  /*! @brief Constructs from ordered atom and bond records
   *
   * @throws EmptyLabelSet If an atom lists no atom type or a bond lists no
   *   bond order and is not the any bond wildcard
   * @throws UnknownVertex If a bond refers to an atom index that is not listed
   * @throws SelfLoop If a bond joins an atom to itself
   * @throws DuplicateEdge If an atom pair is listed twice
   */
  Group(const std::vector<GroupAtom>& atoms, const std::vector<GroupBondRecord>& bonds);
//!@}

//!@name Information
//!@{
  //! Number of atoms
  AtomIndex V() const;
  //! Number of bonds
  std::size_t E() const;

  //! Range of atom indices
  VertexRange vertices() const;
  //! All bonds in ascending order
  std::vector<BondIndex> edges() const;

  /*! @brief Acceptable atom states of an atom
   *
   * @throws std::out_of_range If the atom does not exist
   */
  const GroupAtom& atom(AtomIndex i) const;
  //! Alias of atom
  const GroupAtom& labelsOf(AtomIndex i) const;

  /*! @brief Acceptable bond orders of a bond
   *
   * @throws std::out_of_range If the bond does not exist
   */
  const GroupBond& bond(const BondIndex& bond) const;
  //! Alias of bond
  const GroupBond& labelsOf(const BondIndex& bond) const;

  //! Whether two atoms are bonded
  bool adjacent(AtomIndex i, AtomIndex j) const;
  //! Bonded atoms in ascending order
  std::vector<AtomIndex> neighbors(AtomIndex i) const;
  //! Number of bonds of an atom
  unsigned degree(AtomIndex i) const;

  //! Atoms carrying a label, grouped by label
  std::map<std::string, std::vector<AtomIndex>> labeledAtoms() const;

  //! Deep copy
  Group clone() const;

  //! Underlying labeled graph
  const GraphType& graph() const;
//!@}

/*!@name Specialization
 *
 * @throws std::system_error If Options::Matching::defaultBound is exceeded
 */
//!@{
  /*! @brief Whether @p other embeds into this group such that every atom and
   *   bond of this group is a specific case of its counterpart in @p other
   *
   * Used to arrange groups in trees from generic to specific.
   */
  bool isSpecificCaseOf(const Group& other) const;
//!@}

private:
  GraphType graph_;
};

} // namespace Chemgraph
} // namespace Scine

#endif
