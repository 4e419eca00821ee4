/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_CURRENCY_REGISTRY_HPP
#define KATJING_CURRENCY_REGISTRY_HPP

#include <string_view>
#include <vector>

#include <boost/optional.hpp>
#include "katjing/currency/currency.hpp"

namespace katjing {

  /**
   * Find an ISO 4217 currency by its alphabetic code.
   * @param alphabetic_code - upper case code, e.g. "SEK"
   * @return description of the currency, none if it is not known
   */
  boost::optional<CurrencyInfo> findCurrency(std::string_view alphabetic_code);

  /// Find an ISO 4217 currency by its numeric code, e.g. 752 for SEK
  boost::optional<CurrencyInfo> findCurrency(NumericCodeType numeric_code);

  /// @return all known ISO 4217 currencies ordered by alphabetic code
  const std::vector<CurrencyInfo> &isoCurrencies();

}  // namespace katjing

#endif  // KATJING_CURRENCY_REGISTRY_HPP
