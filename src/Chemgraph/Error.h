/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Exception types and the error category of bounded matching results
 *
 * Malformed graphs are reported by exception at the point of construction.
 * Searches that give up under a caller-supplied bound are not exceptional and
 * are reported through boost::outcome result types carrying a MatchError.
 */

#ifndef INCLUDE_CHEMGRAPH_ERROR_H
#define INCLUDE_CHEMGRAPH_ERROR_H

#include "Chemgraph/Export.h"

#include <stdexcept>
#include <string>
#include <system_error>

namespace Scine {
namespace Chemgraph {

//! Base class of all errors raised while building a graph
class CHEMGRAPH_EXPORT ConstructionError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

//! An unordered vertex pair may carry at most one edge
class CHEMGRAPH_EXPORT DuplicateEdge : public ConstructionError {
public:
  using ConstructionError::ConstructionError;
};

//! An edge endpoint is not a vertex of the graph
class CHEMGRAPH_EXPORT UnknownVertex : public ConstructionError {
public:
  using ConstructionError::ConstructionError;
};

//! A vertex or edge was supplied without any acceptable label
class CHEMGRAPH_EXPORT EmptyLabelSet : public ConstructionError {
public:
  using ConstructionError::ConstructionError;
};

//! Edges must join two distinct vertices
class CHEMGRAPH_EXPORT SelfLoop : public ConstructionError {
public:
  using ConstructionError::ConstructionError;
};

/*! @brief A query received input it cannot answer
 *
 * Raised if a graph handed to a query violates the simple graph invariant or
 * if query arguments refer to vertices that do not exist. Indicates a bug in
 * the caller, retrying will not help.
 */
class CHEMGRAPH_EXPORT InvalidInput : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @brief Errors of bounded matching queries
 */
enum class CHEMGRAPH_EXPORT MatchError {
  /*! @brief The search bound was exceeded before the search was complete
   *
   * Step budget, deadline or cancellation callback of the SearchBound
   * stopped the search. Nothing is known about the existence of further
   * mappings. Widen the bound and retry if the answer is needed.
   */
  SearchAborted = 1
};

namespace Detail {

struct CHEMGRAPH_EXPORT MatchErrorCategory : public std::error_category {
  const char* name() const noexcept final;
  std::string message(int c) const final;
};

} // namespace Detail

//! Singleton error category instance for MatchError
CHEMGRAPH_EXPORT const Detail::MatchErrorCategory& matchErrorCategory();

CHEMGRAPH_EXPORT std::error_code make_error_code(MatchError e);

} // namespace Chemgraph
} // namespace Scine

// Boilerplate to allow interoperability of MatchError with std::error_code
namespace std {
template<> struct is_error_code_enum<Scine::Chemgraph::MatchError> : std::true_type {};
} // namespace std

#endif
