// =============================================================================
// cost_model_test.cpp
// =============================================================================
// Unit tests for mrbt::cost::commission and mrbt::cost::transactionTax.
//
// Validates:
//   - Proportional commission above the minimum
//   - Round-lot (20) and odd-lot (1) minimums
//   - Regular (0.3%) and day-trade (0.15%) tax rates
//   - Custom schedules are honoured
// =============================================================================

#include "mrbt/cost/cost_model.hpp"

#include <gtest/gtest.h>

using mrbt::cost::commission;
using mrbt::cost::transactionTax;

TEST(CostModelTest, CommissionIsProportionalAboveMinimum) {
  // 2000 shares @ 50 = 100,000 → 142.5
  EXPECT_DOUBLE_EQ(commission(100'000.0, false), 100'000.0 * 0.001425);
}

TEST(CostModelTest, RoundLotMinimumIsTwenty) {
  // 10,000 * 0.001425 = 14.25 < 20
  EXPECT_DOUBLE_EQ(commission(10'000.0, false), 20.0);
}

TEST(CostModelTest, OddLotMinimumIsOne) {
  // 500 * 0.001425 = 0.7125 < 1
  EXPECT_DOUBLE_EQ(commission(500.0, true), 1.0);
  // 10,000 * 0.001425 = 14.25 > 1
  EXPECT_DOUBLE_EQ(commission(10'000.0, true), 14.25);
}

TEST(CostModelTest, ZeroValueStillPaysMinimum) {
  EXPECT_DOUBLE_EQ(commission(0.0, false), 20.0);
  EXPECT_DOUBLE_EQ(commission(0.0, true), 1.0);
}

TEST(CostModelTest, RegularTaxRate) {
  EXPECT_DOUBLE_EQ(transactionTax(100'000.0, false), 300.0);
}

TEST(CostModelTest, DayTradeTaxRate) {
  EXPECT_DOUBLE_EQ(transactionTax(100'000.0, true), 150.0);
}

TEST(CostModelTest, CustomScheduleOverridesDefaults) {
  mrbt::domain::CostSchedule schedule;
  schedule.commission_rate = 0.001;
  schedule.min_commission_round_lot = 50.0;
  schedule.tax_rate = 0.01;

  EXPECT_DOUBLE_EQ(commission(10'000.0, false, schedule), 50.0);
  EXPECT_DOUBLE_EQ(commission(100'000.0, false, schedule), 100.0);
  EXPECT_DOUBLE_EQ(transactionTax(1'000.0, false, schedule), 10.0);
}
