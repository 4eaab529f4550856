/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Department of Chemistry and Applied Biosciences, Reiher Group.
 *   See LICENSE.txt for details.
 */

#include "Chemgraph/Options.h"

namespace Scine {
namespace Chemgraph {

MappingDeduplication Options::Matching::deduplication = MappingDeduplication::None;
SearchBound Options::Matching::defaultBound = SearchBound::unbounded();

unsigned Options::Hashing::refinementIterations = 3;

} // namespace Chemgraph
} // namespace Scine
