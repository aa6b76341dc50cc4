// =============================================================================
// performance_report_test.cpp
// =============================================================================
// Unit tests for the performance statistics in mrbt::report.
//
// Validates:
//   - Daily returns, Sharpe (sample stdev, √252) and its undefined cases
//   - Max drawdown as a fraction against the running peak
//   - Trade statistics: win rate, average win/loss, per-reason breakdown
//   - Empty runs report the initial capital
// =============================================================================

#include "mrbt/report/performance_report.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

namespace {

std::vector<mrbt::domain::PortfolioSnapshot> series(
    const std::vector<double>& values) {
  std::vector<mrbt::domain::PortfolioSnapshot> out;
  int day = 1;
  for (double v : values) {
    mrbt::domain::PortfolioSnapshot s;
    s.date = "202401" + std::string(day < 10 ? "0" : "") + std::to_string(day);
    s.cash = v;
    s.portfolio_value = v;
    out.push_back(s);
    ++day;
  }
  return out;
}

mrbt::domain::Trade sell(double pnl, double pnl_pct,
                         mrbt::domain::ExitReason reason) {
  mrbt::domain::Trade t;
  t.action = mrbt::domain::TradeAction::Sell;
  t.pnl = pnl;
  t.pnl_pct = pnl_pct;
  t.reason = reason;
  return t;
}

mrbt::domain::Trade buy() {
  mrbt::domain::Trade t;
  t.action = mrbt::domain::TradeAction::Buy;
  return t;
}

}  // namespace

TEST(PerformanceReportTest, DailyReturnsAreFractional) {
  auto returns = mrbt::report::dailyReturns(series({100.0, 110.0, 99.0}));
  ASSERT_EQ(returns.size(), 2u);
  EXPECT_DOUBLE_EQ(returns[0], 0.10);
  EXPECT_DOUBLE_EQ(returns[1], -0.10);
}

TEST(PerformanceReportTest, SharpeUsesSampleStdevAndAnnualises) {
  auto snaps = series({100.0, 110.0, 99.0, 108.9});
  auto returns = mrbt::report::dailyReturns(snaps);

  double mean = (returns[0] + returns[1] + returns[2]) / 3.0;
  double ss = 0.0;
  for (double r : returns) {
    ss += (r - mean) * (r - mean);
  }
  double expected = mean / std::sqrt(ss / 2.0) * std::sqrt(252.0);

  auto sharpe = mrbt::report::sharpeRatio(snaps);
  ASSERT_TRUE(sharpe.has_value());
  EXPECT_NEAR(*sharpe, expected, 1e-12);
}

TEST(PerformanceReportTest, SharpeUndefinedForShortOrFlatSeries) {
  EXPECT_FALSE(mrbt::report::sharpeRatio(series({})).has_value());
  EXPECT_FALSE(mrbt::report::sharpeRatio(series({100.0})).has_value());
  EXPECT_FALSE(mrbt::report::sharpeRatio(series({100.0, 101.0})).has_value());
  EXPECT_FALSE(
      mrbt::report::sharpeRatio(series({100.0, 100.0, 100.0})).has_value());
}

TEST(PerformanceReportTest, MaxDrawdownAgainstRunningPeak) {
  // Peak 120, trough 90 → -25%
  EXPECT_DOUBLE_EQ(
      mrbt::report::maxDrawdown(series({100.0, 120.0, 90.0, 130.0, 110.0})),
      -0.25);
  EXPECT_DOUBLE_EQ(mrbt::report::maxDrawdown(series({100.0, 110.0})), 0.0);
  EXPECT_DOUBLE_EQ(mrbt::report::maxDrawdown(series({})), 0.0);
}

TEST(PerformanceReportTest, SummarizesTrades) {
  std::vector<mrbt::domain::Trade> trades = {
      buy(),
      buy(),
      buy(),
      sell(4'000.0, 40.0, mrbt::domain::ExitReason::TakeProfit),
      sell(-1'000.0, -10.0, mrbt::domain::ExitReason::StopLoss),
      sell(0.0, 0.0, mrbt::domain::ExitReason::HoldingPeriod),
  };

  auto summary = mrbt::report::summarize(1'000'000.0, trades,
                                         series({1'000'000.0, 1'003'000.0}),
                                         1'003'000.0, {});

  EXPECT_EQ(summary.buy_count, 3u);
  EXPECT_EQ(summary.sell_count, 3u);
  EXPECT_EQ(summary.winning_sells, 1u);
  EXPECT_DOUBLE_EQ(summary.win_rate, 1.0 / 3.0);
  EXPECT_DOUBLE_EQ(summary.total_pnl, 3'000.0);
  EXPECT_DOUBLE_EQ(summary.avg_pnl_pct, 10.0);
  EXPECT_DOUBLE_EQ(summary.avg_win, 4'000.0);
  // A zero-pnl exit counts as a loss.
  EXPECT_DOUBLE_EQ(summary.avg_loss, -500.0);

  ASSERT_EQ(summary.by_reason.size(), 3u);
  EXPECT_EQ(summary.by_reason.at("take_profit").count, 1u);
  EXPECT_DOUBLE_EQ(summary.by_reason.at("stop_loss").avg_pnl_pct, -10.0);

  EXPECT_DOUBLE_EQ(summary.final_value, 1'003'000.0);
  EXPECT_DOUBLE_EQ(summary.total_return, 0.003);
  EXPECT_EQ(summary.trading_days, 2u);
}

TEST(PerformanceReportTest, EmptyRunReportsInitialCapital) {
  auto summary = mrbt::report::summarize(500'000.0, {}, {}, 500'000.0, {});

  EXPECT_DOUBLE_EQ(summary.final_value, 500'000.0);
  EXPECT_DOUBLE_EQ(summary.total_return, 0.0);
  EXPECT_DOUBLE_EQ(summary.win_rate, 0.0);
  EXPECT_FALSE(summary.sharpe_ratio.has_value());
  EXPECT_DOUBLE_EQ(summary.max_drawdown, 0.0);
  EXPECT_TRUE(summary.by_reason.empty());
}
