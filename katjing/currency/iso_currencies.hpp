/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_ISO_CURRENCIES_HPP
#define KATJING_ISO_CURRENCIES_HPP

#include "katjing/currency/currency.hpp"

/**
 * ISO 4217 currencies as (alphabetic code, numeric code, minor unit).
 * Currencies with a minor unit scale other than 1, 100 or 1000 are left out.
 * The same list generates the compile time tags below and the runtime
 * registry in currency_registry.hpp.
 */
#define KATJING_ISO_CURRENCY_LIST(X) \
  X(AUD, 36, 100)                    \
  X(BHD, 48, 1000)                   \
  X(BRL, 986, 100)                   \
  X(CAD, 124, 100)                   \
  X(CHF, 756, 100)                   \
  X(CLP, 152, 1)                     \
  X(CNY, 156, 100)                   \
  X(CZK, 203, 100)                   \
  X(DKK, 208, 100)                   \
  X(EUR, 978, 100)                   \
  X(GBP, 826, 100)                   \
  X(HKD, 344, 100)                   \
  X(HUF, 348, 100)                   \
  X(IQD, 368, 1000)                  \
  X(INR, 356, 100)                   \
  X(ISK, 352, 1)                     \
  X(JOD, 400, 1000)                  \
  X(JPY, 392, 1)                     \
  X(KRW, 410, 1)                     \
  X(KWD, 414, 1000)                  \
  X(LYD, 434, 1000)                  \
  X(MXN, 484, 100)                   \
  X(NOK, 578, 100)                   \
  X(NZD, 554, 100)                   \
  X(OMR, 512, 1000)                  \
  X(PLN, 985, 100)                   \
  X(PYG, 600, 1)                     \
  X(SEK, 752, 100)                   \
  X(SGD, 702, 100)                   \
  X(TND, 788, 1000)                  \
  X(UGX, 800, 1)                     \
  X(USD, 840, 100)                   \
  X(VND, 704, 1)                     \
  X(XAF, 950, 1)                     \
  X(XOF, 952, 1)                     \
  X(ZAR, 710, 100)

namespace katjing {
  namespace iso {

#define KATJING_DECLARE_ISO_CURRENCY(Name, numeric_code, minor_unit) \
  KATJING_ISO_CURRENCY(Name, numeric_code, minor_unit);

    KATJING_ISO_CURRENCY_LIST(KATJING_DECLARE_ISO_CURRENCY)

#undef KATJING_DECLARE_ISO_CURRENCY

  }  // namespace iso
}  // namespace katjing

#endif  // KATJING_ISO_CURRENCIES_HPP
