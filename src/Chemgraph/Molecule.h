/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Concrete chemical graph of a species
 */

#ifndef INCLUDE_CHEMGRAPH_MOLECULE_H
#define INCLUDE_CHEMGRAPH_MOLECULE_H

#include "Chemgraph/AtomTypes.h"
#include "Chemgraph/Graph/LabeledGraph.h"

#include "Utils/Geometry/ElementTypes.h"

#include <map>
#include <string>
#include <vector>

namespace Scine {
namespace Chemgraph {

// Forward-declarations
class Group;

/**
 * @brief Concrete atom state, the vertex label of molecules
 *
 * The element type includes the isotope. Lone pairs are not perceived but
 * taken as given, default zero.
 */
struct CHEMGRAPH_EXPORT Atom {
  Utils::ElementType element = Utils::ElementType::none;
  unsigned radicalElectrons = 0;
  int charge = 0;
  unsigned lonePairs = 0;
  /*! @brief Role of the atom in a reaction template, e.g. "*1"
   *
   * Empty if the atom has no role. Not part of atom equivalence.
   */
  std::string label;

  Atom() = default;
  explicit Atom(
    Utils::ElementType e,
    unsigned radicals = 0,
    int atomCharge = 0,
    unsigned pairs = 0,
    std::string role = ""
  );

  //! Whether element, radical electrons, charge and lone pairs are equal
  bool equivalent(const Atom& other) const;

  //! Equivalence including the label
  bool operator == (const Atom& other) const;
  bool operator != (const Atom& other) const;
};

//! Atom pair and bond order of a bond to add to a molecule
struct CHEMGRAPH_EXPORT BondRecord {
  AtomIndex first;
  AtomIndex second;
  BondType type;
};

/**
 * @brief Concrete chemical graph
 *
 * Every atom carries exactly one concrete atom state and every bond exactly
 * one bond order. The molecule may consist of several disconnected parts,
 * e.g. to model a reacting pair.
 *
 * Queries do not modify the molecule and keep no caches, so concurrent
 * queries on the same instance are safe. Modifications must be serialized
 * with queries by the caller.
 *
 * @note Removing an atom renumbers all atoms with larger indices down by one.
 */
class CHEMGRAPH_EXPORT Molecule {
public:
//!@name Member types
//!@{
  using GraphType = LabeledGraph<Atom, BondType>;
  using VertexRange = GraphType::VertexRange;
//!@}

//!@name Constructors
//!@{
  //! Empty molecule
  Molecule();

  /*! @brief Constructs from ordered atom and bond records
   *
   * @throws EmptyLabelSet If an atom has no element type
   * @throws UnknownVertex If a bond refers to an atom index that is not listed
   * @throws SelfLoop If a bond joins an atom to itself
   * @throws DuplicateEdge If an atom pair is listed twice
   */
  Molecule(const std::vector<Atom>& atoms, const std::vector<BondRecord>& bonds);
//!@}

//!@name Modifiers
//!@{
  /*! @brief Adds an atom
   *
   * @throws EmptyLabelSet If the atom has no element type
   */
  AtomIndex addAtom(const Atom& atom);

  /*! @brief Adds a bond between two existing atoms
   *
   * @throws UnknownVertex If either atom does not exist
   * @throws SelfLoop If both indices are the same
   * @throws DuplicateEdge If the atoms are already bonded
   */
  BondIndex addBond(AtomIndex i, AtomIndex j, BondType type = BondType::Single);

  /*! @brief Removes an atom and all its bonds
   *
   * Atoms with larger indices are renumbered down by one.
   *
   * @throws std::out_of_range If the atom does not exist
   */
  void removeAtom(AtomIndex i);

  /*! @brief Removes a bond
   *
   * @throws std::out_of_range If the bond does not exist
   */
  void removeBond(const BondIndex& bond);

  /*! @brief Changes the order of an existing bond
   *
   * @throws std::out_of_range If the bond does not exist
   */
  void setBondType(const BondIndex& bond, BondType type);

  /*! @brief Replaces the state of an existing atom
   *
   * @throws std::out_of_range If the atom does not exist
   * @throws EmptyLabelSet If the atom has no element type
   */
  void setAtom(AtomIndex i, const Atom& atom);

  /*! @brief Copies another molecule into this one as a disconnected part
   *
   * @returns New indices of the other molecule's atoms
   */
  std::vector<AtomIndex> merge(const Molecule& other);
//!@}

//!@name Graph information
//!@{
  //! Number of atoms
  AtomIndex V() const;
  //! Number of bonds
  std::size_t E() const;

  //! Range of atom indices
  VertexRange vertices() const;
  //! All bonds in ascending order
  std::vector<BondIndex> edges() const;

  /*! @brief Atom state
   *
   * @throws std::out_of_range If the atom does not exist
   */
  const Atom& atom(AtomIndex i) const;
  //! Alias of atom
  const Atom& labelsOf(AtomIndex i) const;

  /*! @brief Bond order of a bond
   *
   * @throws std::out_of_range If the bond does not exist
   */
  BondType bondType(const BondIndex& bond) const;
  //! Alias of bondType
  BondType labelsOf(const BondIndex& bond) const;

  //! Whether two atoms are bonded
  bool adjacent(AtomIndex i, AtomIndex j) const;
  //! Bonded atoms in ascending order
  std::vector<AtomIndex> neighbors(AtomIndex i) const;
  //! Number of bonds of an atom
  unsigned degree(AtomIndex i) const;

  //! Deep copy
  Molecule clone() const;

  //! Underlying labeled graph
  const GraphType& graph() const;
//!@}

//!@name Chemistry
//!@{
  /*! @brief Most specific atom type of an atom, perceived from its bonds
   *
   * @throws std::out_of_range If the atom does not exist
   */
  AtomType atomType(AtomIndex i) const;
  //! Atom types of all atoms
  std::vector<AtomType> atomTypes() const;
  //! Counts of an atom's bonds by order
  BondCounts bondCounts(AtomIndex i) const;

  /*! @brief Empirical formula in Hill order
   *
   * Carbon first, hydrogen second, then the remaining elements
   * alphabetically. Without carbon, all elements are alphabetical. Isotopes
   * count as their base element.
   */
  std::string formula() const;
  //! Sum of atomic masses in g/mol
  double molecularWeight() const;
  //! Total number of radical electrons
  unsigned radicalCount() const;
  //! Whether any atom carries a radical electron
  bool isRadical() const;
  //! Net charge
  int charge() const;
  //! Atoms carrying a label, grouped by label
  std::map<std::string, std::vector<AtomIndex>> labeledAtoms() const;
//!@}

//!@name Rings and connectivity
//!@{
  //! Whether the molecule contains any ring
  bool isCyclic() const;
  //! Whether an atom lies on a ring
  bool isAtomInCycle(AtomIndex i) const;
  //! Whether a bond lies on a ring
  bool isBondInCycle(const BondIndex& bond) const;
  //! Smallest set of smallest rings
  std::vector<Ring> sssr() const;
  //! Whether all atoms are connected
  bool isConnected() const;
  //! Atom index lists of the disconnected parts
  std::vector<std::vector<AtomIndex>> connectedComponents() const;
  //! Splits into molecules for each disconnected part
  std::vector<Molecule> split() const;
//!@}

/*!@name Matching
 *
 * Convenience queries with Options::Matching::defaultBound.
 *
 * @throws std::system_error If the default search bound is exceeded
 */
//!@{
  //! Whether this molecule is isomorphic to another
  bool isIsomorphic(const Molecule& other) const;
  //! Isomorphism mapping from this molecule's atoms to another's, if any
  boost::optional<IndexMap> findIsomorphism(const Molecule& other) const;
  //! Whether a group embeds into this molecule
  bool isSubgraphIsomorphic(const Group& group) const;
  //! All embeddings of a group into this molecule
  std::vector<IndexMap> findSubgraphIsomorphisms(const Group& group) const;
//!@}

private:
  explicit Molecule(GraphType graph);

  GraphType graph_;
};

} // namespace Chemgraph
} // namespace Scine

#endif
