/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "katjing/settlement/settlement.hpp"

#include <cstdint>
#include <utility>

#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_costs.hpp"
#include "katjing/currency/iso_currencies.hpp"

using namespace katjing;
using framework::money::Tax;
using iso::SEK;

/**
 * @given 2.00 SEK and a price of 1.90 SEK
 * @when the price is paid
 * @then 0.10 SEK of change is returned
 */
TEST(PayTest, Affordable) {
  auto result = pay(Money<SEK>::create(2), Price<SEK>::inMinorUnits(190));
  KATJING_ASSERT_RESULT_VALUE(result);
  EXPECT_EQ(std::move(result).assumeValue().toString(), "0.10 SEK");
}

/**
 * @given a cost equal to the balance
 * @when it is paid
 * @then the payment succeeds with zero change
 */
TEST(PayTest, ExactAmount) {
  auto result = pay(Money<SEK, std::uint16_t>::inMinorUnits(500),
                    Tax<SEK, std::uint32_t>::inMinorUnits(500));
  KATJING_ASSERT_RESULT_VALUE(result);
  EXPECT_TRUE(result.assumeValue().isZero());
}

/**
 * @given 1.90 SEK and a price of 2.00 SEK
 * @when the price is paid
 * @then the payment is refused and both amounts are handed back untouched
 */
TEST(PayTest, InsufficientFunds) {
  auto result = pay(Money<SEK>::inMinorUnits(190), price<SEK>(std::uint64_t{2}));
  KATJING_ASSERT_RESULT_ERROR(result);
  const auto &error = result.assumeError();
  EXPECT_EQ(error.available.value(), 190u);
  EXPECT_EQ(error.required.value(), 200u);
  EXPECT_EQ(error.toString(),
            "InsufficientFunds: [required=Price: [2.00 SEK], "
            "available=1.90 SEK]");
}

/**
 * @given a refused payment
 * @when more money is added to the returned balance and payment is retried
 * @then the retry succeeds
 */
TEST(PayTest, RetryAfterRefusal) {
  auto refused =
      pay(Money<SEK>::inMinorUnits(150), Price<SEK>::inMinorUnits(180));
  KATJING_ASSERT_RESULT_ERROR(refused);
  auto error = std::move(refused).assumeError();

  auto topped_up = Money<SEK>::inMinorUnits(error.available.value() + 100);
  auto retried = pay(std::move(topped_up), std::move(error.required));
  KATJING_ASSERT_RESULT_VALUE(retried);
  EXPECT_EQ(retried.assumeValue().value(), 70u);
  EXPECT_TRUE(error.required.isZero());
}

/**
 * @given balance narrower than the cost
 * @when a cost beyond the balance's range is paid
 * @then the payment is refused
 */
TEST(PayTest, CostBeyondBalanceRange) {
  auto result = pay(Money<SEK, std::uint8_t>::inMinorUnits(255),
                    Price<SEK, std::uint32_t>::inMinorUnits(256));
  KATJING_ASSERT_RESULT_ERROR(result);
  EXPECT_EQ(result.assumeError().available.value(), 255u);
}

/**
 * @given a zero cost
 * @when it is paid
 * @then the whole balance comes back as change
 */
TEST(PayTest, ZeroCost) {
  auto result = pay(Money<SEK>::inMinorUnits(42), Price<SEK>::zero());
  KATJING_ASSERT_RESULT_VALUE(result);
  EXPECT_EQ(result.assumeValue().value(), 42u);
}
