/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_MINOR_UNITS_HPP
#define KATJING_MINOR_UNITS_HPP

#include <cstddef>
#include <string>

#include <boost/optional.hpp>
#include "katjing/currency/currency.hpp"
#include "katjing/value/numeric_value.hpp"

namespace katjing {
  namespace detail {

    /**
     * Scale a number of major units of currency C to minor units.
     * @return the scaled value, none if it does not fit into V
     */
    template <typename C, typename V>
    boost::optional<V> majorToMinorUnits(const V &major) {
      using Traits = ValueTraits<V>;
      auto scale = convert<V>(C::kMinorUnit);
      if (not scale) {
        // only zero major units are representable at all
        if (major == Traits::zero()) {
          return Traits::zero();
        }
        return boost::none;
      }
      return Traits::checkedMul(major, *scale);
    }

    /**
     * Render a minor unit value of currency C as
     * "{major}.{minor} {code}", the fractional part zero padded to the
     * currency's number of decimals. Currencies without a fractional part
     * render as "{major} {code}".
     */
    template <typename C, typename V>
    std::string formatMinorUnits(const V &value) {
      using Traits = ValueTraits<V>;
      constexpr int kDigits = minorUnitDigits(C::kMinorUnit);

      std::string result;
      if (kDigits == 0) {
        result = Traits::toString(value);
      } else {
        V major = Traits::zero();
        V minor = value;
        if (auto scale = convert<V>(C::kMinorUnit)) {
          major = V(value / *scale);
          minor = V(value % *scale);
        }
        auto fraction = Traits::toString(minor);
        fraction.insert(
            0, static_cast<std::size_t>(kDigits) - fraction.size(), '0');
        result = Traits::toString(major);
        result.append(".").append(fraction);
      }
      result.append(" ").append(C::kAlphabeticCode);
      return result;
    }

  }  // namespace detail
}  // namespace katjing

#endif  // KATJING_MINOR_UNITS_HPP
