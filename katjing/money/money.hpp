/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_MONEY_HPP
#define KATJING_MONEY_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include <boost/optional.hpp>
#include "common/report_abort.h"
#include "katjing/currency/currency.hpp"
#include "katjing/value/minor_units.hpp"
#include "katjing/value/numeric_value.hpp"

namespace katjing {

  /**
   * Funds in hand: a non-negative amount of currency C stored in minor units
   * as a V. The currency only exists at compile time, so Money<C, V> takes
   * exactly as much memory as V, and money of different currencies cannot be
   * mixed.
   *
   * Money can be moved but not copied. A moved-from object holds zero, so
   * funds are never duplicated. Settlement functions take Money by value
   * which makes every spend an explicit std::move at the call site.
   *
   * @tparam C - currency tag
   * @tparam V - numeric value type, see ValueTraits
   */
  template <typename C, typename V = std::uint64_t>
  class Money {
    static_assert(isValue<V>, "Money requires an unsigned integer value type");
    static_assert(isValidMinorUnit(C::kMinorUnit),
                  "currency minor unit must be 1, 100 or 1000");

    using Traits = ValueTraits<V>;

   public:
    using CurrencyType = C;
    using ValueType = V;

    /// Money from a value already expressed in minor units
    static Money inMinorUnits(V value) {
      return Money(std::move(value));
    }

    /**
     * Money from major units, e.g. Money<SEK>::tryCreate(1) is 1.00 SEK.
     * @return none if the value in minor units does not fit into V
     */
    static boost::optional<Money> tryCreate(const V &major) {
      if (auto minor = detail::majorToMinorUnits<C>(major)) {
        return Money(std::move(*minor));
      }
      return boost::none;
    }

    /**
     * Money from major units. The caller guarantees that the value in minor
     * units fits into V; the process is aborted otherwise.
     */
    static Money create(const V &major) {
      auto money = tryCreate(major);
      if (not money) {
        report_abort("money in minor units does not fit the value type");
      }
      return std::move(*money);
    }

    static Money zero() {
      return Money(Traits::zero());
    }

    Money(const Money &) = delete;
    Money &operator=(const Money &) = delete;

    Money(Money &&other) noexcept
        : value_(std::exchange(other.value_, Traits::zero())) {}

    Money &operator=(Money &&other) noexcept {
      value_ = std::exchange(other.value_, Traits::zero());
      return *this;
    }

    ~Money() = default;

    /// @return amount in minor units
    const V &value() const {
      return value_;
    }

    bool isZero() const {
      return value_ == Traits::zero();
    }

    bool operator==(const Money &rhs) const {
      return value_ == rhs.value_;
    }

    bool operator!=(const Money &rhs) const {
      return not(*this == rhs);
    }

    bool operator<(const Money &rhs) const {
      return value_ < rhs.value_;
    }

    bool operator>(const Money &rhs) const {
      return rhs < *this;
    }

    bool operator<=(const Money &rhs) const {
      return not(rhs < *this);
    }

    bool operator>=(const Money &rhs) const {
      return not(*this < rhs);
    }

    /// Human readable form, e.g. "1.33 SEK"
    std::string toString() const {
      return detail::formatMinorUnits<C>(value_);
    }

   private:
    explicit Money(V value) : value_(std::move(value)) {}

    V value_;
  };

  template <typename C, typename V>
  std::ostream &operator<<(std::ostream &os, const Money<C, V> &money) {
    return os << money.toString();
  }

}  // namespace katjing

#endif  // KATJING_MONEY_HPP
