/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "katjing/settlement/settlement.hpp"

#include <cstdint>
#include <utility>

#include <gtest/gtest.h>
#include <boost/multiprecision/cpp_int.hpp>
#include "framework/operation_traits.hpp"
#include "framework/test_costs.hpp"
#include "katjing/currency/iso_currencies.hpp"

using namespace katjing;
using boost::multiprecision::uint128_t;
using framework::money::Shipping;
using iso::EUR;
using iso::SEK;

static_assert(not framework::money::IsTakeable<Money<EUR>, Price<SEK>>::value,
              "a cost is never taken from money of another currency");
static_assert(not framework::money::IsPayable<Money<EUR>, Price<SEK>>::value,
              "a cost is never paid with money of another currency");
static_assert(framework::money::IsTakeable<Money<EUR, std::uint8_t>,
                                           Price<EUR, std::uint64_t>>::value,
              "settlement accepts any widths of one currency");
static_assert(not framework::money::IsTakeable<Price<EUR>, Money<EUR>>::value,
              "a cost cannot be spent like money");

/**
 * @given EUR 10.00 and a shipping cost of 0.12
 * @when the cost is paid with the money
 * @then 9.88 remain and nothing is left unpaid
 */
TEST(SettlementTest, PayShippingInFull) {
  auto result = payWith(Money<EUR>::inMinorUnits(1000),
                        Shipping<EUR>::inMinorUnits(12));
  EXPECT_EQ(result.change.value(), 988u);
  EXPECT_TRUE(result.unpaid.isZero());
  EXPECT_EQ(result.toString(),
            "PaymentResult: [change=9.88 EUR, unpaid=Shipping: [0.00 EUR]]");
}

/**
 * @given u8 money of 15 and a u32 cost of 20
 * @when the cost is taken from the money
 * @then the money is exhausted and 15 is taken
 */
TEST(SettlementTest, TakeMoreThanNarrowBalance) {
  auto result = take(Money<SEK, std::uint8_t>::inMinorUnits(15),
                     Price<SEK, std::uint32_t>::inMinorUnits(20));
  EXPECT_TRUE(result.remaining.isZero());
  EXPECT_EQ(result.taken.value(), 15u);
}

/**
 * @given u16 money of 512 and a u8 cost of 128
 * @when the cost is taken from the money
 * @then 384 remain and the whole cost is taken
 */
TEST(SettlementTest, TakeNarrowCostFromWideBalance) {
  auto result = take(Money<SEK, std::uint16_t>::inMinorUnits(512),
                     Price<SEK, std::uint8_t>::inMinorUnits(128));
  EXPECT_EQ(result.remaining.value(), 384u);
  EXPECT_EQ(result.taken.value(), 128u);
  EXPECT_EQ(result.toString(),
            "TakeResult: [remaining=3.84 SEK, taken=Price: [1.28 SEK]]");
}

/**
 * @given a cost exactly equal to the balance
 * @when the cost is taken
 * @then the balance is exhausted and the cost is taken in full
 */
TEST(SettlementTest, TakeExactBalance) {
  auto result = take(Money<SEK>::inMinorUnits(200),
                     Price<SEK, std::uint16_t>::inMinorUnits(200));
  EXPECT_TRUE(result.remaining.isZero());
  EXPECT_EQ(result.taken.value(), 200u);
}

/**
 * @given a cost larger than anything the money's value type can hold
 * @when it is paid with the largest possible money of that type
 * @then the money is exhausted and the difference stays unpaid
 */
TEST(SettlementTest, SaturatedCost) {
  auto result =
      payWith(Money<SEK, std::uint8_t>::inMinorUnits(255),
              Price<SEK, std::uint64_t>::inMinorUnits(std::uint64_t{1} << 40));
  EXPECT_TRUE(result.change.isZero());
  EXPECT_EQ(result.unpaid.value(), (std::uint64_t{1} << 40) - 255u);
}

/**
 * @given the largest 128-bit cost and u64 money
 * @when the cost is paid
 * @then all money is taken and the rest stays unpaid
 */
TEST(SettlementTest, WideCostFromNarrowMoney) {
  const auto max = std::numeric_limits<uint128_t>::max();
  const auto balance = std::numeric_limits<std::uint64_t>::max();
  auto result = payWith(Money<EUR>::inMinorUnits(balance),
                        Shipping<EUR, uint128_t>::inMinorUnits(max));
  EXPECT_TRUE(result.change.isZero());
  EXPECT_EQ(result.unpaid.value(), max - uint128_t(balance));
}

/**
 * @given balance and cost consumed by the settlement
 * @when they are moved into payWith
 * @then the moved-from objects hold zero
 */
TEST(SettlementTest, ArgumentsAreConsumed) {
  auto money = Money<EUR>::inMinorUnits(500);
  auto cost = Shipping<EUR>::inMinorUnits(300);
  auto result = payWith(std::move(money), std::move(cost));
  EXPECT_TRUE(money.isZero());
  EXPECT_TRUE(cost.isZero());
  EXPECT_EQ(result.change.value(), 200u);
  EXPECT_TRUE(result.unpaid.isZero());
}

/**
 * Pairs of money and cost value types in every width combination
 */
template <typename MV, typename AV>
struct Widths {
  using MoneyValue = MV;
  using CostValue = AV;
};

template <typename W>
class CrossWidthSettlementTest : public ::testing::Test {
 protected:
  using MV = typename W::MoneyValue;
  using AV = typename W::CostValue;
  using MoneyType = Money<SEK, MV>;
  using CostType = Shipping<SEK, AV>;
};

using WidthPairs = ::testing::Types<Widths<std::uint8_t, std::uint8_t>,
                                    Widths<std::uint8_t, std::uint16_t>,
                                    Widths<std::uint8_t, std::uint64_t>,
                                    Widths<std::uint16_t, std::uint8_t>,
                                    Widths<std::uint32_t, std::uint16_t>,
                                    Widths<std::uint64_t, std::uint32_t>,
                                    Widths<std::uint64_t, uint128_t>,
                                    Widths<uint128_t, std::uint8_t>,
                                    Widths<uint128_t, uint128_t>>;
TYPED_TEST_SUITE(CrossWidthSettlementTest, WidthPairs, );

/**
 * @given money and a smaller cost
 * @when the cost is paid
 * @then the change is the difference and nothing stays unpaid
 */
TYPED_TEST(CrossWidthSettlementTest, Affordable) {
  using MV = typename TestFixture::MV;
  using AV = typename TestFixture::AV;
  auto result = payWith(TestFixture::MoneyType::inMinorUnits(MV(200u)),
                        TestFixture::CostType::inMinorUnits(AV(55u)));
  EXPECT_EQ(result.change.value(), MV(145u));
  EXPECT_TRUE(result.unpaid.isZero());
}

/**
 * @given money and a larger cost
 * @when the cost is paid
 * @then the money is exhausted and the difference stays unpaid
 */
TYPED_TEST(CrossWidthSettlementTest, Unaffordable) {
  using MV = typename TestFixture::MV;
  using AV = typename TestFixture::AV;
  auto result = payWith(TestFixture::MoneyType::inMinorUnits(MV(55u)),
                        TestFixture::CostType::inMinorUnits(AV(200u)));
  EXPECT_TRUE(result.change.isZero());
  EXPECT_EQ(result.unpaid.value(), AV(145u));
}

/**
 * @given a zero cost
 * @when it is paid
 * @then the balance is returned unchanged
 */
TYPED_TEST(CrossWidthSettlementTest, ZeroCostKeepsBalance) {
  using MV = typename TestFixture::MV;
  auto result = payWith(TestFixture::MoneyType::inMinorUnits(MV(77u)),
                        TestFixture::CostType::zero());
  EXPECT_EQ(result.change.value(), MV(77u));
  EXPECT_TRUE(result.unpaid.isZero());

  auto taken = take(TestFixture::MoneyType::inMinorUnits(MV(77u)),
                    TestFixture::CostType::zero());
  EXPECT_EQ(taken.remaining.value(), MV(77u));
  EXPECT_TRUE(taken.taken.isZero());
}

/**
 * @given zero money
 * @when any cost is paid
 * @then nothing is taken and the whole cost stays unpaid
 */
TYPED_TEST(CrossWidthSettlementTest, ZeroMoney) {
  using AV = typename TestFixture::AV;
  auto result = payWith(TestFixture::MoneyType::zero(),
                        TestFixture::CostType::inMinorUnits(AV(9u)));
  EXPECT_TRUE(result.change.isZero());
  EXPECT_EQ(result.unpaid.value(), AV(9u));
}

/**
 * @given the maximum of both value types
 * @when the cost is taken
 * @then taken plus remaining equals the balance and taken never exceeds the
 * cost
 */
TYPED_TEST(CrossWidthSettlementTest, ConservesAtLimits) {
  using MV = typename TestFixture::MV;
  using AV = typename TestFixture::AV;
  const MV balance = ValueTraits<MV>::maxValue();
  const AV requested = ValueTraits<AV>::maxValue();
  auto result = take(TestFixture::MoneyType::inMinorUnits(balance),
                     TestFixture::CostType::inMinorUnits(requested));
  EXPECT_LE(compareValues(result.taken.value(), requested), 0);
  EXPECT_LE(compareValues(result.taken.value(), balance), 0);
  EXPECT_EQ(compareValues(convert<uint128_t>(result.remaining.value()).value()
                              + convert<uint128_t>(result.taken.value()).value(),
                          balance),
            0);
}
