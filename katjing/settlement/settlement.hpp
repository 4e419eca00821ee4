/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_SETTLEMENT_HPP
#define KATJING_SETTLEMENT_HPP

#include <string>
#include <utility>

#include "common/report_abort.h"
#include "common/result.hpp"
#include "katjing/cost/cost.hpp"
#include "katjing/money/money.hpp"
#include "katjing/settlement/payment_error.hpp"
#include "katjing/utils/string_builder.hpp"
#include "katjing/value/numeric_value.hpp"

namespace katjing {

  /// Outcome of take(): what is left of the balance and what was taken.
  template <typename M, typename A>
  struct TakeResult {
    M remaining;
    A taken;

    std::string toString() const {
      return detail::PrettyStringBuilder()
          .init("TakeResult")
          .appendNamed("remaining", remaining)
          .appendNamed("taken", taken)
          .finalize();
    }
  };

  /// Outcome of payWith(): change left over and the part still owed.
  template <typename M, typename A>
  struct PaymentResult {
    M change;
    A unpaid;

    std::string toString() const {
      return detail::PrettyStringBuilder()
          .init("PaymentResult")
          .appendNamed("change", change)
          .appendNamed("unpaid", unpaid)
          .finalize();
    }
  };

  template <typename M, typename A>
  using PayResult = expected::Result<M, InsufficientFunds<M, A>>;

  namespace detail {
    /// Translation that the caller has already proven to fit
    template <typename To, typename From>
    To convertChecked(const From &value) {
      auto converted = convert<To>(value);
      if (not converted) {
        report_abort("value proven to fit does not convert");
      }
      return std::move(*converted);
    }
  }  // namespace detail

  /**
   * Take as much of the amount as the balance covers.
   *
   * The amount is first expressed in the balance's value type, saturating at
   * its maximum when it does not fit, which makes it unaffordable in full.
   * Then:
   *   amount < balance:  remaining = balance - amount, taken = amount
   *   amount >= balance: remaining = 0, taken = balance
   * The taken part is reported in the amount's value type; it never exceeds
   * the original amount, so it always fits.
   *
   * @param money - balance, consumed
   * @param amount - requested amount, consumed
   * @return remaining balance and the part of the amount actually taken
   */
  template <typename C, typename MV, typename Kind, typename AV>
  TakeResult<Money<C, MV>, Cost<Kind, C, AV>> take(Money<C, MV> money,
                                                   Cost<Kind, C, AV> amount) {
    using MoneyType = Money<C, MV>;
    using CostType = Cost<Kind, C, AV>;

    const MV &balance = money.value();
    const MV needed = convertOrSaturate<MV>(amount.value());

    if (needed < balance) {
      auto rest = ValueTraits<MV>::checkedSub(balance, needed);
      if (not rest) {
        report_abort("balance underflow although amount is smaller");
      }
      return {MoneyType::inMinorUnits(std::move(*rest)),
              CostType::inMinorUnits(detail::convertChecked<AV>(needed))};
    }
    return {MoneyType::zero(),
            CostType::inMinorUnits(detail::convertChecked<AV>(balance))};
  }

  /**
   * Pay the cost with the given money, accepting partial payment.
   * @param money - balance, consumed
   * @param cost - cost to pay, consumed
   * @return the change and the part of the cost that is still unpaid
   */
  template <typename C, typename MV, typename Kind, typename AV>
  PaymentResult<Money<C, MV>, Cost<Kind, C, AV>> payWith(
      Money<C, MV> money, Cost<Kind, C, AV> cost) {
    using CostType = Cost<Kind, C, AV>;

    const AV requested = cost.value();
    auto result = take(std::move(money), std::move(cost));
    auto unpaid = ValueTraits<AV>::checkedSub(requested, result.taken.value());
    if (not unpaid) {
      report_abort("taken more than requested");
    }
    return {std::move(result.remaining),
            CostType::inMinorUnits(std::move(*unpaid))};
  }

  /**
   * Pay the cost in full or not at all.
   * @param money - balance, consumed
   * @param cost - cost to pay, consumed
   * @return the change, or InsufficientFunds holding both arguments untouched
   * when the cost exceeds the balance
   */
  template <typename C, typename MV, typename Kind, typename AV>
  PayResult<Money<C, MV>, Cost<Kind, C, AV>> pay(Money<C, MV> money,
                                                 Cost<Kind, C, AV> cost) {
    using Error = InsufficientFunds<Money<C, MV>, Cost<Kind, C, AV>>;

    if (cost > money) {
      return expected::makeError(Error{std::move(cost), std::move(money)});
    }
    return expected::makeValue(
        payWith(std::move(money), std::move(cost)).change);
  }

}  // namespace katjing

#endif  // KATJING_SETTLEMENT_HPP
