/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "katjing/currency/currency.hpp"

#include "katjing/utils/string_builder.hpp"

namespace katjing {

  bool CurrencyInfo::operator==(const CurrencyInfo &rhs) const {
    return alphabetic_code == rhs.alphabetic_code
        and numeric_code == rhs.numeric_code and minor_unit == rhs.minor_unit;
  }

  bool CurrencyInfo::operator!=(const CurrencyInfo &rhs) const {
    return not(*this == rhs);
  }

  std::string CurrencyInfo::toString() const {
    return detail::PrettyStringBuilder()
        .init("Currency")
        .appendNamed("code", alphabetic_code)
        .appendNamed("numeric", numeric_code)
        .appendNamed("minor_unit", minor_unit)
        .finalize();
  }

}  // namespace katjing
