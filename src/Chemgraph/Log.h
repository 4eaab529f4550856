/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Department of Chemistry and Applied Biosciences, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Basic Logging functionality for debugging
 */

#ifndef INCLUDE_CHEMGRAPH_LOG_H
#define INCLUDE_CHEMGRAPH_LOG_H

#include "Chemgraph/Export.h"
#include <unordered_set>
#include <iostream>

namespace Scine {
namespace Chemgraph {
namespace Log {

namespace Detail {
class NullBuffer : public std::streambuf {
public:
  int overflow(int c) override;
};

extern NullBuffer nullBuffer;
extern std::ostream nullStream;
} // namespace Detail

//! Level of logging
enum class CHEMGRAPH_EXPORT Level : unsigned {
  Trace,
  Debug,
  Info,
  Warning,
  Error,
  Fatal,
  None
};

//! Particular cases of special logging items that may or may not be desired
enum class CHEMGRAPH_EXPORT Particulars {
  /*! In the isomorphism engine, the chosen vertex order, candidate counts and
   * the number of steps taken by each search
   */
  IsomorphismSearch,
  //! In ring perception, candidate cycles and their acceptance into the SSSR
  RingPerception,
  //! Bucket sizes and hash collisions in the species registry
  SpeciesRegistry
};

//! Library logging level
CHEMGRAPH_EXPORT extern Level level;
//! Library logging particulars
CHEMGRAPH_EXPORT extern std::unordered_set<Particulars> particulars;

/**
 * @brief Fetch a log handle with a logging level
 * @param decisionLevel logging level of a message to write to a stream
 * @return std::cout if level is greater or equal to the library logging level,
 *   a null-stream otherwise
 */
CHEMGRAPH_EXPORT std::ostream& log(const Level& decisionLevel);
/**
 * @brief Fetch a log handle with a particular
 * @param particular The particular to which the message pertains
 * @return std::cout if the particular is part of the current library
 *   particulars, a null-stream otherwise
 */
CHEMGRAPH_EXPORT std::ostream& log(const Particulars& particular);
//! Checks whether a particular is part of the current library particulars
CHEMGRAPH_EXPORT bool isSet(Particulars particular);

} // namespace Log
} // namespace Chemgraph
} // namespace Scine
#endif
