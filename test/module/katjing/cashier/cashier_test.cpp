/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "katjing/cashier/cashier.hpp"

#include <cstdint>
#include <memory>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "framework/mock_logger.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_costs.hpp"
#include "framework/test_logger.hpp"
#include "katjing/currency/iso_currencies.hpp"

using namespace katjing;
using framework::money::Shipping;
using iso::EUR;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class CashierTest : public ::testing::Test {
 public:
  void SetUp() override {
    ON_CALL(*log_, shouldLog(_)).WillByDefault(Return(true));
  }

  std::shared_ptr<NiceMock<MockLogger>> log_ =
      std::make_shared<NiceMock<MockLogger>>();
  Cashier cashier_{log_};
};

/**
 * @given cashier
 * @when a cost is settled
 * @then the partial payment is returned and logged at debug level
 */
TEST_F(CashierTest, SettleLogsDebug) {
  EXPECT_CALL(*log_,
              logInternal(logger::LogLevel::kDebug,
                          "settling Shipping: [5.00 EUR] with 3.00 EUR"));
  EXPECT_CALL(*log_,
              logInternal(logger::LogLevel::kDebug, HasSubstr("settled: ")));
  EXPECT_CALL(*log_, logInternal(logger::LogLevel::kWarn, _)).Times(0);

  auto result = cashier_.settle(Money<EUR>::create(3), Shipping<EUR>::create(5));
  EXPECT_TRUE(result.change.isZero());
  EXPECT_EQ(result.unpaid.value(), 200u);
}

/**
 * @given cashier
 * @when an affordable cost is charged
 * @then the change is returned and a debug line is logged
 */
TEST_F(CashierTest, ChargeSucceeds) {
  EXPECT_CALL(*log_,
              logInternal(logger::LogLevel::kDebug, "charged, change 1.50 EUR"));
  EXPECT_CALL(*log_, logInternal(logger::LogLevel::kWarn, _)).Times(0);

  auto result = cashier_.charge(Money<EUR>::inMinorUnits(200),
                                Price<EUR>::inMinorUnits(50));
  KATJING_ASSERT_RESULT_VALUE(result);
  EXPECT_EQ(result.assumeValue().value(), 150u);
}

/**
 * @given cashier
 * @when a cost larger than the balance is charged
 * @then the refusal is returned and logged as a warning
 */
TEST_F(CashierTest, ChargeRefusedLogsWarning) {
  EXPECT_CALL(
      *log_,
      logInternal(logger::LogLevel::kWarn,
                  "charge refused: InsufficientFunds: [required=Price: "
                  "[0.50 EUR], available=0.20 EUR]"));

  auto result = cashier_.charge(Money<EUR, std::uint16_t>::inMinorUnits(20),
                                Price<EUR, std::uint8_t>::inMinorUnits(50));
  KATJING_ASSERT_RESULT_ERROR(result);
  EXPECT_EQ(result.assumeError().available.value(), 20u);
}

/**
 * @given cashier writing to the spdlog backed test logger
 * @when payments are settled and charged
 * @then the results do not depend on the logger
 */
TEST(CashierSpdlogTest, RealLogger) {
  Cashier cashier(getTestLogger("Cashier"));
  auto settled = cashier.settle(Money<EUR>::inMinorUnits(1000),
                                Shipping<EUR>::inMinorUnits(12));
  EXPECT_EQ(settled.change.value(), 988u);

  auto refused =
      cashier.charge(Money<EUR>::inMinorUnits(1), Price<EUR>::inMinorUnits(2));
  KATJING_ASSERT_RESULT_ERROR(refused);
}
