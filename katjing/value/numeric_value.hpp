/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_NUMERIC_VALUE_HPP
#define KATJING_NUMERIC_VALUE_HPP

#include <algorithm>
#include <ciso646>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

#include <boost/optional.hpp>

namespace katjing {

  namespace detail {
    /// bool and the character types are integers but never amounts
    template <typename V>
    constexpr bool isCharacterLike() {
      using T = std::remove_cv_t<V>;
      return std::is_same<T, bool>::value or std::is_same<T, char>::value
          or std::is_same<T, wchar_t>::value
          or std::is_same<T, char16_t>::value
          or std::is_same<T, char32_t>::value;
    }

    template <typename V>
    constexpr bool isBoundedUnsignedInteger() {
      using Limits = std::numeric_limits<V>;
      return Limits::is_specialized and Limits::is_integer
          and not Limits::is_signed and Limits::is_bounded
          and not isCharacterLike<V>();
    }
  }  // namespace detail

  /**
   * Capabilities of a type used as raw storage of a monetary value.
   *
   * Any bounded unsigned integer qualifies: the built-in unsigned widths and
   * the fixed width boost::multiprecision unsigned integers (uint128_t,
   * checked_uint256_t, ...). Other types leave ValueTraits undefined.
   */
  template <typename V, typename Enable = void>
  struct ValueTraits;

  template <typename V>
  struct ValueTraits<
      V,
      std::enable_if_t<detail::isBoundedUnsignedInteger<V>()>> {
    using Limits = std::numeric_limits<V>;

    /// Number of value bits of the representation
    static constexpr int digits = Limits::digits;

    static V zero() {
      return V(0u);
    }

    static V maxValue() {
      return (Limits::max)();
    }

    /// @return lhs - rhs, or none if rhs is greater than lhs
    static boost::optional<V> checkedSub(const V &lhs, const V &rhs) {
      if (lhs < rhs) {
        return boost::none;
      }
      return V(lhs - rhs);
    }

    /// @return lhs * rhs, or none if the product does not fit
    static boost::optional<V> checkedMul(const V &lhs, const V &rhs) {
      if (rhs != zero() and lhs > V(maxValue() / rhs)) {
        return boost::none;
      }
      return V(lhs * rhs);
    }

    /// Decimal representation
    static std::string toString(const V &value) {
      if constexpr (std::is_class<V>::value) {
        return value.str();
      } else if constexpr (digits
                           <= std::numeric_limits<std::uintmax_t>::digits) {
        return std::to_string(static_cast<std::uintmax_t>(value));
      } else {
        // built-in integers wider than uintmax_t, e.g. unsigned __int128
        std::string result;
        V rest = value;
        do {
          auto digit = static_cast<int>(rest % 10u);
          result.push_back(static_cast<char>('0' + digit));
          rest /= 10u;
        } while (rest != zero());
        std::reverse(result.begin(), result.end());
        return result;
      }
    }
  };

  /// Whether V satisfies the numeric value contract
  template <typename V>
  constexpr bool isValue = detail::isBoundedUnsignedInteger<V>();

  /**
   * Translate a value into another representation.
   * @return the same number in To, or none if it does not fit
   */
  template <typename To, typename From>
  boost::optional<To> convert(const From &value) {
    static_assert(isValue<To> and isValue<From>,
                  "convert requires numeric value types");
    if constexpr (ValueTraits<From>::digits <= ValueTraits<To>::digits) {
      return static_cast<To>(value);
    } else {
      if (value > static_cast<From>(ValueTraits<To>::maxValue())) {
        return boost::none;
      }
      return static_cast<To>(value);
    }
  }

  /**
   * Translate a value into another representation, clamping to the maximum
   * value of To if it does not fit.
   */
  template <typename To, typename From>
  To convertOrSaturate(const From &value) {
    if (auto converted = convert<To>(value)) {
      return *converted;
    }
    return ValueTraits<To>::maxValue();
  }

  /**
   * Three-way comparison of numbers held in possibly different
   * representations.
   * @return negative if lhs < rhs, zero if equal, positive if lhs > rhs
   */
  template <typename L, typename R>
  int compareValues(const L &lhs, const R &rhs) {
    if constexpr (ValueTraits<L>::digits >= ValueTraits<R>::digits) {
      auto widened = static_cast<L>(rhs);
      return lhs < widened ? -1 : (widened < lhs ? 1 : 0);
    } else {
      auto widened = static_cast<R>(lhs);
      return widened < rhs ? -1 : (rhs < widened ? 1 : 0);
    }
  }

}  // namespace katjing

#endif  // KATJING_NUMERIC_VALUE_HPP
