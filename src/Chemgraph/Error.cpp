/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/Error.h"

namespace Scine {
namespace Chemgraph {
namespace Detail {

const char* MatchErrorCategory::name() const noexcept {
  return "ChemgraphMatchError";
}

std::string MatchErrorCategory::message(int c) const {
  switch(static_cast<MatchError>(c)) {
    case MatchError::SearchAborted:
      return "Search bound exceeded before the search space was exhausted.";
    default:
      return "Unknown error.";
  }
}

} // namespace Detail

const Detail::MatchErrorCategory& matchErrorCategory() {
  static Detail::MatchErrorCategory c;
  return c;
}

std::error_code make_error_code(const MatchError e) {
  return {static_cast<int>(e), matchErrorCategory()};
}

} // namespace Chemgraph
} // namespace Scine
