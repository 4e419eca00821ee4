/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_PAYMENT_ERROR_HPP
#define KATJING_PAYMENT_ERROR_HPP

#include <string>

#include "katjing/utils/string_builder.hpp"

namespace katjing {

  /**
   * The balance does not cover the cost. Both operands are handed back
   * untouched so the caller can add funds and retry.
   * @tparam M - Money type
   * @tparam A - Cost type
   */
  template <typename M, typename A>
  struct InsufficientFunds {
    A required;
    M available;

    std::string toString() const {
      return detail::PrettyStringBuilder()
          .init("InsufficientFunds")
          .appendNamed("required", required)
          .appendNamed("available", available)
          .finalize();
    }
  };

}  // namespace katjing

#endif  // KATJING_PAYMENT_ERROR_HPP
