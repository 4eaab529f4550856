/*!@file
 * @copyright This code is licensed under the 3-clause BSD license.
 *   Copyright ETH Zurich, Laboratory of Physical Chemistry, Reiher Group.
 *   See LICENSE.txt for details.
 * @brief bitmask class
 *
 * Contains a bitmask implementation for strong enums with explicit underlying
 * types and unmodified representational values. Used as the label set type of
 * wildcard atoms and bonds.
 */

#ifndef INCLUDE_CHEMGRAPH_TEMPLE_BITMASK_H
#define INCLUDE_CHEMGRAPH_TEMPLE_BITMASK_H

#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace Scine {
namespace Chemgraph {
namespace Temple {

/**
 * @brief Set of enum values stored as bits of the enum's underlying type
 *
 * @tparam EnumType Enum on which the bitmask should act. Requires the enum to
 * have strictly incrementing unsigned representation starting at zero.
 */
template<typename EnumType>
struct Bitmask {
//!@name Types
//!@{
  using Underlying = std::underlying_type_t<EnumType>;
//!@}

  static_assert(
    std::is_unsigned<Underlying>::value
    && std::is_integral<Underlying>::value,
    "Underlying type for this enum type must unsigned and integral"
  );

  //! Largest representable enum value
  static constexpr Underlying maximum = std::numeric_limits<Underlying>::digits - 1;

//!@name Public state
//!@{
  Underlying value;
//!@}

//!@name Constructors
//!@{
  constexpr Bitmask() : value {0} {}

  explicit Bitmask(EnumType a) : value {bit(a)} {}

  Bitmask(std::initializer_list<EnumType> values) : value {0} {
    for(const EnumType a : values) {
      value |= bit(a);
    }
  }

  explicit constexpr Bitmask(Underlying a) : value {a} {}
//!@}

//!@name Information
//!@{
  /*! @brief Checks whether an enum value is set in the bitmask
   *
   * @complexity{@math{\Theta(1)}}
   */
  constexpr bool isSet(const EnumType& a) const {
    return (
      value & (
        static_cast<Underlying>(1) << static_cast<Underlying>(a)
      )
    ) > 0;
  }

  //! Whether no enum value is set
  constexpr bool empty() const {
    return value == 0;
  }

  //! Number of set enum values
  unsigned count() const {
    unsigned n = 0;
    for(Underlying v = value; v > 0; v &= v - 1) {
      ++n;
    }
    return n;
  }

  //! Whether every value set in this bitmask is also set in @p other
  constexpr bool isSubsetOf(const Bitmask& other) const {
    return (value & ~other.value) == 0;
  }

  //! Set enum values in ascending order
  std::vector<EnumType> values() const {
    std::vector<EnumType> set;
    for(Underlying i = 0; i <= maximum; ++i) {
      if((value >> i) & static_cast<Underlying>(1)) {
        set.push_back(static_cast<EnumType>(i));
      }
    }
    return set;
  }
//!@}

//!@name Operators
//!@{
  /*! @brief Create a new bitmask that also sets a particular enum value
   *
   * @complexity{@math{\Theta(1)}}
   */
  Bitmask operator | (const EnumType& a) const {
    return Bitmask {
      static_cast<Underlying>(value | bit(a))
    };
  }

  //! Union of two bitmasks
  constexpr Bitmask operator | (const Bitmask& other) const {
    return Bitmask {
      static_cast<Underlying>(value | other.value)
    };
  }

  /*! @brief Set a particular enum value in this bitmask
   *
   * @complexity{@math{\Theta(1)}}
   */
  void operator |= (const EnumType& a) {
    value = value | bit(a);
  }

  //! Check whether a particular enum value is set
  constexpr bool operator & (const EnumType& a) const {
    return isSet(a);
  }

  //! Check whether a particular enum value is set
  constexpr bool operator [] (const EnumType& a) const {
    return isSet(a);
  }

  constexpr bool operator == (const Bitmask& other) const {
    return value == other.value;
  }

  constexpr bool operator != (const Bitmask& other) const {
    return value != other.value;
  }
//!@}

private:
  static Underlying bit(const EnumType a) {
    const auto v = static_cast<Underlying>(a);

    if(v > maximum) {
      throw std::domain_error(
        "This enum has too many options to be representable as a bitmask "
        "in the specified underlying type."
      );
    }

    return static_cast<Underlying>(1) << v;
  }
};

template<typename EnumType>
Bitmask<EnumType> make_bitmask(EnumType a) {
  return Bitmask<EnumType> {a};
}

} // namespace Temple
} // namespace Chemgraph
} // namespace Scine

#endif
