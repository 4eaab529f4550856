/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Department of Chemistry and Applied Biosciences, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Centralizes the main customization points of the library's behavior.
 */

#ifndef INCLUDE_CHEMGRAPH_OPTIONS_H
#define INCLUDE_CHEMGRAPH_OPTIONS_H

#include "Chemgraph/SearchBound.h"

namespace Scine {
namespace Chemgraph {

/**
 * @brief Treatment of subgraph mappings that differ only by a symmetry of the
 *   pattern
 *
 * A pattern with internal symmetry, e.g. a carbon bearing two identical
 * wildcard substituents, embeds into a target once per pattern automorphism
 * at every site.
 */
enum class CHEMGRAPH_EXPORT MappingDeduplication {
  //! Every raw mapping is reported
  None,
  /*! Mappings with the same image that are related by an automorphism of the
   * pattern (including its labels) are reported once, as the
   * lexicographically smallest mapping of the class
   */
  PatternSymmetry
};

/**
 * @brief Contains all global settings for the library
 */
struct CHEMGRAPH_EXPORT Options {
  //! Settings of the subgraph and isomorphism front ends
  struct CHEMGRAPH_EXPORT Matching {
    /*! @brief Deduplication of enumerated subgraph mappings
     *
     * Defaults to None.
     */
    static MappingDeduplication deduplication;

    /*! @brief Bound used by the convenience queries of Molecule and Group
     *
     * Defaults to an unbounded search.
     */
    static SearchBound defaultBound;
  };

  //! Settings of vertex invariants and canonical hashes
  struct CHEMGRAPH_EXPORT Hashing {
    /*! @brief Number of color refinement rounds
     *
     * Defaults to three.
     */
    static unsigned refinementIterations;
  };
};

} // namespace Chemgraph
} // namespace Scine

#endif
