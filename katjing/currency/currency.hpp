/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_CURRENCY_HPP
#define KATJING_CURRENCY_HPP

#include <cstdint>
#include <string>

#include "katjing/value/numeric_value.hpp"

namespace katjing {

  template <typename C, typename V>
  class Money;

  template <typename Kind, typename C, typename V>
  class Cost;

  using MinorUnitType = std::uint16_t;
  using NumericCodeType = std::uint16_t;

  /// Minor unit scales a currency may declare
  constexpr bool isValidMinorUnit(MinorUnitType minor_unit) {
    return minor_unit == 1 or minor_unit == 100 or minor_unit == 1000;
  }

  /// Number of fractional digits rendered for the given minor unit scale
  constexpr int minorUnitDigits(MinorUnitType minor_unit) {
    int digits = 0;
    for (; minor_unit > 1; minor_unit /= 10) {
      ++digits;
    }
    return digits;
  }

  /// Runtime description of a currency
  struct CurrencyInfo {
    std::string alphabetic_code;
    NumericCodeType numeric_code;
    MinorUnitType minor_unit;

    bool operator==(const CurrencyInfo &rhs) const;
    bool operator!=(const CurrencyInfo &rhs) const;

    std::string toString() const;
  };

  /**
   * Base of every currency tag. A currency tag is an empty type that is never
   * instantiated, it only keeps money of different currencies apart at
   * compile time. Derived tags provide:
   *   static constexpr const char *kAlphabeticCode;
   *   static constexpr NumericCodeType kNumericCode;
   *   static constexpr MinorUnitType kMinorUnit;
   * Use KATJING_CURRENCY or KATJING_ISO_CURRENCY instead of deriving by hand.
   * @tparam Tag - the derived currency tag
   */
  template <typename Tag>
  struct Currency {
    /**
     * Create money of this currency from major units, e.g. EUR::create(12u)
     * is 12.00 EUR. Aborts if the scaled value does not fit into V.
     */
    template <typename V>
    static Money<Tag, V> create(V value) {
      return Money<Tag, V>::create(value);
    }

    /// Create money of this currency from minor units
    template <typename V>
    static Money<Tag, V> createInMinorUnits(V value) {
      return Money<Tag, V>::inMinorUnits(value);
    }

    /**
     * Create a payable amount of the given kind from major units.
     * Aborts if the scaled value does not fit into V.
     */
    template <typename Kind, typename V>
    static Cost<Kind, Tag, V> cost(V value) {
      return Cost<Kind, Tag, V>::create(value);
    }

    /// Create a payable amount of the given kind from minor units
    template <typename Kind, typename V>
    static Cost<Kind, Tag, V> costInMinorUnits(V value) {
      return Cost<Kind, Tag, V>::inMinorUnits(value);
    }

    Currency() = delete;
  };

  /// @return runtime description of currency tag C
  template <typename C>
  CurrencyInfo currencyInfo() {
    return CurrencyInfo{C::kAlphabeticCode, C::kNumericCode, C::kMinorUnit};
  }

}  // namespace katjing

/**
 * Declare an ISO 4217 currency tag.
 * @param Name - alphabetic code, also the name of the generated type
 * @param numeric_code - ISO 4217 numeric code
 * @param minor_unit - minor units per major unit: 1, 100 or 1000
 */
#define KATJING_ISO_CURRENCY(Name, numeric_code, minor_unit)          \
  struct Name : ::katjing::Currency<Name> {                           \
    static constexpr const char *kAlphabeticCode = #Name;             \
    static constexpr ::katjing::NumericCodeType kNumericCode =        \
        numeric_code;                                                 \
    static constexpr ::katjing::MinorUnitType kMinorUnit = minor_unit; \
    static_assert(::katjing::isValidMinorUnit(kMinorUnit),            \
                  #Name " minor unit must be 1, 100 or 1000");        \
  }

/**
 * Declare a currency tag without an ISO numeric code, e.g. for in-game or
 * test currencies.
 */
#define KATJING_CURRENCY(Name, minor_unit) \
  KATJING_ISO_CURRENCY(Name, 0, minor_unit)

#endif  // KATJING_CURRENCY_HPP
