/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "katjing/currency/currency_registry.hpp"

#include <algorithm>
#include <utility>

#include "katjing/currency/iso_currencies.hpp"

namespace {
  std::vector<katjing::CurrencyInfo> makeIsoCurrencies() {
    std::vector<katjing::CurrencyInfo> currencies{
#define KATJING_ISO_CURRENCY_INFO(Name, numeric_code, minor_unit) \
  katjing::currencyInfo<katjing::iso::Name>(),
        KATJING_ISO_CURRENCY_LIST(KATJING_ISO_CURRENCY_INFO)
#undef KATJING_ISO_CURRENCY_INFO
    };
    std::sort(currencies.begin(),
              currencies.end(),
              [](const auto &lhs, const auto &rhs) {
                return lhs.alphabetic_code < rhs.alphabetic_code;
              });
    return currencies;
  }

  template <typename Predicate>
  boost::optional<katjing::CurrencyInfo> findIf(Predicate &&predicate) {
    const auto &currencies = katjing::isoCurrencies();
    auto it = std::find_if(currencies.begin(),
                           currencies.end(),
                           std::forward<Predicate>(predicate));
    if (it == currencies.end()) {
      return boost::none;
    }
    return *it;
  }
}  // namespace

namespace katjing {

  boost::optional<CurrencyInfo> findCurrency(std::string_view alphabetic_code) {
    return findIf([alphabetic_code](const CurrencyInfo &info) {
      return info.alphabetic_code == alphabetic_code;
    });
  }

  boost::optional<CurrencyInfo> findCurrency(NumericCodeType numeric_code) {
    return findIf([numeric_code](const CurrencyInfo &info) {
      return info.numeric_code == numeric_code;
    });
  }

  const std::vector<CurrencyInfo> &isoCurrencies() {
    static const std::vector<CurrencyInfo> currencies = makeIsoCurrencies();
    return currencies;
  }

}  // namespace katjing
