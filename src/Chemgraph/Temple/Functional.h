/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief Functional-style container-related algorithms
 *
 * Mostly STL algorithm shortcuts operating on whole containers.
 */

#ifndef INCLUDE_CHEMGRAPH_TEMPLE_FUNCTIONAL_H
#define INCLUDE_CHEMGRAPH_TEMPLE_FUNCTIONAL_H

#include <algorithm>
#include <iterator>
#include <numeric>
#include <utility>
#include <vector>

namespace Scine {
namespace Chemgraph {
namespace Temple {

/*! @brief Maps all values of a container using a unary function. Returns a vector
 *
 * @complexity{@math{\Theta(N)}}
 */
template<class Container, class UnaryFunction>
auto map(const Container& container, UnaryFunction&& function) {
  using U = decltype(function(*std::begin(container)));

  std::vector<U> returnContainer;
  returnContainer.reserve(
    std::distance(std::begin(container), std::end(container))
  );

  for(const auto& value : container) {
    returnContainer.push_back(function(value));
  }

  return returnContainer;
}

/**
 * @brief Accumulate shorthand
 *
 * @complexity{@math{\Theta(N)}}
 */
template<class Container, typename T, class BinaryFunction>
T accumulate(
  const Container& container,
  T init,
  BinaryFunction&& reductionFunction
) {
  for(const auto& value: container) {
    init = reductionFunction(std::move(init), value);
  }

  return init;
}

/*! @brief all_of shorthand
 *
 * @complexity{@math{O(N)}}
 */
template<class Container, class UnaryPredicate>
bool all_of(const Container& container, UnaryPredicate&& predicate) {
  for(const auto& element : container) {
    if(!predicate(element)) {
      return false;
    }
  }

  return true;
}

/*! @brief any_of shorthand
 *
 * @complexity{@math{O(N)}}
 */
template<class Container, class UnaryPredicate>
bool any_of(const Container& container, UnaryPredicate&& predicate) {
  for(const auto& element : container) {
    if(predicate(element)) {
      return true;
    }
  }

  return false;
}

//! Calls std::sort on a container
template<class Container>
void sort(Container& container) {
  std::sort(
    std::begin(container),
    std::end(container)
  );
}

//! Calls std::sort with a custom comparator on a container
template<class Container, typename Comparator>
void sort(Container& container, Comparator&& comparator) {
  std::sort(
    std::begin(container),
    std::end(container),
    std::forward<Comparator>(comparator)
  );
}

// C++17 nodiscard
template<class Container>
Container sorted(Container container) {
  sort(container);
  return container;
}

// C++17 nodiscard
template<class Container, typename Comparator>
Container sorted(Container container, Comparator&& comparator) {
  sort(container, std::forward<Comparator>(comparator));
  return container;
}

//! Sorts and removes consecutive duplicates in-place
template<class Container>
void sortUnique(Container& container) {
  sort(container);
  container.erase(
    std::unique(std::begin(container), std::end(container)),
    std::end(container)
  );
}

//! @brief std::find shorthand
template<class Container, typename T>
auto find(const Container& container, const T& needle) {
  return std::find(
    std::begin(container),
    std::end(container),
    needle
  );
}

//! @brief vector iota shorthand
template<typename T>
std::vector<T> iota(T upperBound) {
  std::vector<T> values(upperBound);

  std::iota(
    std::begin(values),
    std::end(values),
    T(0)
  );

  return values;
}

//! @brief Creates a predicate that uses std::find for the container's value type
template<class Container>
auto makeContainsPredicate(const Container& container) {
  return [&container](const auto& element) -> bool {
    return std::find(
      std::begin(container),
      std::end(container),
      element
    ) != std::end(container);
  };
}

} // namespace Temple
} // namespace Chemgraph
} // namespace Scine

#endif
