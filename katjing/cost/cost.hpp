/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_COST_HPP
#define KATJING_COST_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include <boost/optional.hpp>
#include "common/report_abort.h"
#include "katjing/currency/currency.hpp"
#include "katjing/money/money.hpp"
#include "katjing/utils/string_builder.hpp"
#include "katjing/value/minor_units.hpp"
#include "katjing/value/numeric_value.hpp"

namespace katjing {

  /**
   * Something owed: a non-negative amount of currency C stored in minor
   * units. Cost has the same layout and ownership rules as Money but is a
   * different type, and costs of different kinds (price, shipping, ...) do not
   * mix either. Declare kinds with KATJING_COST.
   *
   * @tparam Kind - tag of the cost kind, exposes kName
   * @tparam C - currency tag
   * @tparam V - numeric value type, see ValueTraits
   */
  template <typename Kind, typename C, typename V = std::uint64_t>
  class Cost {
    static_assert(isValue<V>, "Cost requires an unsigned integer value type");
    static_assert(isValidMinorUnit(C::kMinorUnit),
                  "currency minor unit must be 1, 100 or 1000");

    using Traits = ValueTraits<V>;

   public:
    using KindType = Kind;
    using CurrencyType = C;
    using ValueType = V;

    static Cost inMinorUnits(V value) {
      return Cost(std::move(value));
    }

    /// @return cost from major units, none if it does not fit into V
    static boost::optional<Cost> tryCreate(const V &major) {
      if (auto minor = detail::majorToMinorUnits<C>(major)) {
        return Cost(std::move(*minor));
      }
      return boost::none;
    }

    /// Cost from major units, aborts if the minor units do not fit into V
    static Cost create(const V &major) {
      auto cost = tryCreate(major);
      if (not cost) {
        report_abort("cost in minor units does not fit the value type");
      }
      return std::move(*cost);
    }

    static Cost zero() {
      return Cost(Traits::zero());
    }

    Cost(const Cost &) = delete;
    Cost &operator=(const Cost &) = delete;

    Cost(Cost &&other) noexcept
        : value_(std::exchange(other.value_, Traits::zero())) {}

    Cost &operator=(Cost &&other) noexcept {
      value_ = std::exchange(other.value_, Traits::zero());
      return *this;
    }

    ~Cost() = default;

    const V &value() const {
      return value_;
    }

    bool isZero() const {
      return value_ == Traits::zero();
    }

    bool operator==(const Cost &rhs) const {
      return value_ == rhs.value_;
    }

    bool operator!=(const Cost &rhs) const {
      return not(*this == rhs);
    }

    bool operator<(const Cost &rhs) const {
      return value_ < rhs.value_;
    }

    bool operator>(const Cost &rhs) const {
      return rhs < *this;
    }

    bool operator<=(const Cost &rhs) const {
      return not(rhs < *this);
    }

    bool operator>=(const Cost &rhs) const {
      return not(*this < rhs);
    }

    /// e.g. "Shipping: [0.12 EUR]"
    std::string toString() const {
      return detail::PrettyStringBuilder()
          .init(Kind::kName)
          .append(detail::formatMinorUnits<C>(value_))
          .finalize();
    }

   private:
    explicit Cost(V value) : value_(std::move(value)) {}

    V value_;
  };

  template <typename Kind, typename C, typename V>
  std::ostream &operator<<(std::ostream &os, const Cost<Kind, C, V> &cost) {
    return os << cost.toString();
  }

  // Cost against Money of the same currency, compared in minor units
  // regardless of the value types.

  template <typename Kind, typename C, typename AV, typename MV>
  bool operator==(const Cost<Kind, C, AV> &cost, const Money<C, MV> &money) {
    return compareValues(cost.value(), money.value()) == 0;
  }

  template <typename Kind, typename C, typename AV, typename MV>
  bool operator!=(const Cost<Kind, C, AV> &cost, const Money<C, MV> &money) {
    return compareValues(cost.value(), money.value()) != 0;
  }

  template <typename Kind, typename C, typename AV, typename MV>
  bool operator<(const Cost<Kind, C, AV> &cost, const Money<C, MV> &money) {
    return compareValues(cost.value(), money.value()) < 0;
  }

  template <typename Kind, typename C, typename AV, typename MV>
  bool operator<=(const Cost<Kind, C, AV> &cost, const Money<C, MV> &money) {
    return compareValues(cost.value(), money.value()) <= 0;
  }

  template <typename Kind, typename C, typename AV, typename MV>
  bool operator>(const Cost<Kind, C, AV> &cost, const Money<C, MV> &money) {
    return compareValues(cost.value(), money.value()) > 0;
  }

  template <typename Kind, typename C, typename AV, typename MV>
  bool operator>=(const Cost<Kind, C, AV> &cost, const Money<C, MV> &money) {
    return compareValues(cost.value(), money.value()) >= 0;
  }

  template <typename C, typename MV, typename Kind, typename AV>
  bool operator==(const Money<C, MV> &money, const Cost<Kind, C, AV> &cost) {
    return cost == money;
  }

  template <typename C, typename MV, typename Kind, typename AV>
  bool operator!=(const Money<C, MV> &money, const Cost<Kind, C, AV> &cost) {
    return cost != money;
  }

  template <typename C, typename MV, typename Kind, typename AV>
  bool operator<(const Money<C, MV> &money, const Cost<Kind, C, AV> &cost) {
    return cost > money;
  }

  template <typename C, typename MV, typename Kind, typename AV>
  bool operator<=(const Money<C, MV> &money, const Cost<Kind, C, AV> &cost) {
    return cost >= money;
  }

  template <typename C, typename MV, typename Kind, typename AV>
  bool operator>(const Money<C, MV> &money, const Cost<Kind, C, AV> &cost) {
    return cost < money;
  }

  template <typename C, typename MV, typename Kind, typename AV>
  bool operator>=(const Money<C, MV> &money, const Cost<Kind, C, AV> &cost) {
    return cost <= money;
  }

}  // namespace katjing

/**
 * Declare a kind of cost. For example KATJING_COST(Shipping, shipping)
 * declares:
 *   struct ShippingKind;                      the kind tag
 *   template <C, V> using Shipping = Cost<ShippingKind, C, V>;
 *   shipping<C>(major)                        constructor from major units
 *   shippingInMinorUnits<C>(minor)            constructor from minor units
 * @param Name - name of the kind and of the alias template
 * @param suffix - name of the constructor functions
 */
#define KATJING_COST(Name, suffix)                                 \
  struct Name##Kind {                                              \
    static constexpr const char *kName = #Name;                    \
  };                                                               \
  template <typename C, typename V = std::uint64_t>                \
  using Name = ::katjing::Cost<Name##Kind, C, V>;                  \
  template <typename C, typename V>                                \
  inline Name<C, V> suffix(V major) {                              \
    return Name<C, V>::create(major);                              \
  }                                                                \
  template <typename C, typename V>                                \
  inline Name<C, V> suffix##InMinorUnits(V minor) {                \
    return Name<C, V>::inMinorUnits(minor);                        \
  }

namespace katjing {

  /// The general purpose cost kind: price<SEK>(200u)
  KATJING_COST(Price, price)

}  // namespace katjing

#endif  // KATJING_COST_HPP
