/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_CASHIER_HPP
#define KATJING_CASHIER_HPP

#include <utility>

#include "common/result.hpp"
#include "katjing/settlement/settlement.hpp"
#include "logger/logger.hpp"

namespace katjing {

  /**
   * Performs settlements and reports them to a logger. Keeps no state between
   * calls besides the logger, so one instance may serve any number of
   * payments.
   */
  class Cashier {
   public:
    /**
     * @param log - receives a debug line per settlement and a warning per
     * refused charge
     */
    explicit Cashier(logger::LoggerPtr log) : log_(std::move(log)) {}

    /**
     * Settle the cost with the money, accepting partial payment.
     * @see payWith
     */
    template <typename C, typename MV, typename Kind, typename AV>
    PaymentResult<Money<C, MV>, Cost<Kind, C, AV>> settle(
        Money<C, MV> money, Cost<Kind, C, AV> cost) const {
      log_->debug("settling {} with {}", cost, money);
      auto result = payWith(std::move(money), std::move(cost));
      log_->debug("settled: {}", result);
      return result;
    }

    /**
     * Charge the cost in full.
     * @see pay
     */
    template <typename C, typename MV, typename Kind, typename AV>
    PayResult<Money<C, MV>, Cost<Kind, C, AV>> charge(
        Money<C, MV> money, Cost<Kind, C, AV> cost) const {
      auto result = pay(std::move(money), std::move(cost));
      result.match(
          [this](const auto &change) {
            log_->debug("charged, change {}", change.value);
          },
          [this](const auto &refusal) {
            log_->warn("charge refused: {}", refusal.error);
          });
      return result;
    }

   private:
    logger::LoggerPtr log_;
  };

}  // namespace katjing

#endif  // KATJING_CASHIER_HPP
