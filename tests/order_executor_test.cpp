// =============================================================================
// order_executor_test.cpp
// =============================================================================
// Unit tests for mrbt::OrderExecutor.
//
// Validates:
//   - Position sizing: 10% of cash, board-lot rounding, odd lots below 1000
//   - BUY accounting, stop-loss arming and the cash invariant
//   - Rejections leave state untouched (no shares, no cash, re-entry window)
//   - SELL accounting: commission, regular and same-day tax, pnl, holding days
//   - Limit orders: placement, fill against the low, expiry
// =============================================================================

#include "mrbt/calendar/trading_calendar.hpp"
#include "mrbt/data/market_data_store.hpp"
#include "mrbt/execution/order_executor.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

namespace {

// "20240101".."20240128", every date a session.
std::vector<std::string> januaryDates() {
  std::vector<std::string> dates;
  for (int day = 1; day <= 28; ++day) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "202401%02d", day);
    dates.emplace_back(buf);
  }
  return dates;
}

}  // namespace

class OrderExecutorTest : public ::testing::Test {
 protected:
  mrbt::TradingCalendar calendar{januaryDates()};
  mrbt::domain::StrategyParams params;
  mrbt::MarketDataStore prices;

  mrbt::OrderExecutor executor() const { return {params, calendar}; }

  static mrbt::EngineState stateWithCash(double cash) {
    mrbt::EngineState state;
    state.cash = cash;
    return state;
  }

  static mrbt::BuyRequest request(const std::string& ticker, double price,
                                  const std::string& fill_date,
                                  const std::string& signal_date) {
    mrbt::BuyRequest r;
    r.ticker = ticker;
    r.display_name = ticker + "-name";
    r.price = price;
    r.fill_date = fill_date;
    r.signal_date = signal_date;
    return r;
  }

  void addBar(const std::string& ticker, const std::string& date, double low,
              double close) {
    mrbt::domain::PriceBar bar;
    bar.ticker = ticker;
    bar.date = date;
    bar.open = close;
    bar.high = close;
    bar.low = low;
    bar.close = close;
    prices.addBar(bar);
  }
};

// =============================================================================
// Sizing
// =============================================================================

TEST_F(OrderExecutorTest, SizingRoundsDownToBoardLots) {
  auto sizing = executor().sizeOrder(1'000'000.0, 50.0);
  EXPECT_EQ(sizing.shares, 2000);
  EXPECT_FALSE(sizing.is_odd_lot);

  // 100,000 / 60 = 1666 → one lot
  sizing = executor().sizeOrder(1'000'000.0, 60.0);
  EXPECT_EQ(sizing.shares, 1000);
  EXPECT_FALSE(sizing.is_odd_lot);
}

TEST_F(OrderExecutorTest, SizingBelowOneLotTradesOddLot) {
  // 100,000 / 150 = 666
  auto sizing = executor().sizeOrder(1'000'000.0, 150.0);
  EXPECT_EQ(sizing.shares, 666);
  EXPECT_TRUE(sizing.is_odd_lot);
}

TEST_F(OrderExecutorTest, SizingNeverProducesSharesForBadInputs) {
  EXPECT_EQ(executor().sizeOrder(1'000'000.0, 0.0).shares, 0);
  EXPECT_EQ(executor().sizeOrder(0.0, 50.0).shares, 0);
  EXPECT_EQ(executor().sizeOrder(100.0, 1500.0).shares, 0);
}

// =============================================================================
// BUY
// =============================================================================

// -----------------------------------------------------------------------------
// 1,000,000 cash, open 50 → 2000 shares, value 100,000, commission 142.5.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, MarketBuyDebitsCashAndOpensPosition) {
  auto result = executor().buy(stateWithCash(1'000'000.0),
                               request("2330", 50.0, "20240103", "20240102"));

  ASSERT_EQ(result.trades.size(), 1u);
  EXPECT_TRUE(result.rejections.empty());

  const auto& trade = result.trades.front();
  EXPECT_EQ(trade.action, mrbt::domain::TradeAction::Buy);
  EXPECT_EQ(trade.shares, 2000);
  EXPECT_DOUBLE_EQ(trade.value, 100'000.0);
  EXPECT_DOUBLE_EQ(trade.commission, 142.5);
  EXPECT_DOUBLE_EQ(trade.net_amount, 100'142.5);
  EXPECT_EQ(trade.signal_date, "20240102");
  EXPECT_EQ(trade.entry_mode, mrbt::domain::EntryMode::MarketAtOpen);
  EXPECT_FALSE(trade.is_odd_lot);

  EXPECT_DOUBLE_EQ(result.state.cash, 899'857.5);
  const auto* pos = result.state.ledger.position("2330");
  ASSERT_NE(pos, nullptr);
  EXPECT_EQ(pos->shares, 2000);
  EXPECT_DOUBLE_EQ(pos->weighted_cost, 50.0);
  EXPECT_EQ(pos->entry_date, "20240103");
}

TEST_F(OrderExecutorTest, BuyArmsStopLossWhenEnabled) {
  auto result = executor().buy(stateWithCash(1'000'000.0),
                               request("2330", 50.0, "20240103", "20240102"));

  const auto* stop = result.state.ledger.stopOrder("2330");
  ASSERT_NE(stop, nullptr);
  EXPECT_DOUBLE_EQ(stop->trigger_price, 45.0);
  EXPECT_EQ(stop->shares, 2000);
}

TEST_F(OrderExecutorTest, BuyDoesNotArmStopWhenDisabled) {
  params.enable_stop_loss = false;
  auto result = executor().buy(stateWithCash(1'000'000.0),
                               request("2330", 50.0, "20240103", "20240102"));

  EXPECT_EQ(result.trades.size(), 1u);
  EXPECT_TRUE(result.state.ledger.stopOrders().empty());
}

TEST_F(OrderExecutorTest, OddLotBuyUsesOddLotMinimum) {
  // 1,000 cash → 100 notional → 10 shares @ 10, commission max(0.1425, 1)
  auto result = executor().buy(stateWithCash(1'000.0),
                               request("1101", 10.0, "20240103", "20240102"));

  ASSERT_EQ(result.trades.size(), 1u);
  EXPECT_TRUE(result.trades.front().is_odd_lot);
  EXPECT_EQ(result.trades.front().shares, 10);
  EXPECT_DOUBLE_EQ(result.trades.front().commission, 1.0);
  EXPECT_DOUBLE_EQ(result.state.cash, 1'000.0 - 100.0 - 1.0);
}

TEST_F(OrderExecutorTest, ZeroSharesIsRejectedWithoutStateChange) {
  auto result = executor().buy(stateWithCash(100.0),
                               request("2330", 1500.0, "20240103", "20240102"));

  EXPECT_TRUE(result.trades.empty());
  ASSERT_EQ(result.rejections.size(), 1u);
  EXPECT_EQ(result.rejections.front().reason, mrbt::RejectReason::NoShares);
  EXPECT_DOUBLE_EQ(result.state.cash, 100.0);
  EXPECT_TRUE(result.state.ledger.empty());
}

TEST_F(OrderExecutorTest, InsufficientCashIsRejectedWithoutStateChange) {
  // Full-cash sizing: 1000 shares @ 10 = 10,000 + 20 commission > 10,000.
  params.position_size_ratio = 1.0;
  auto result = executor().buy(stateWithCash(10'000.0),
                               request("2330", 10.0, "20240103", "20240102"));

  EXPECT_TRUE(result.trades.empty());
  ASSERT_EQ(result.rejections.size(), 1u);
  EXPECT_EQ(result.rejections.front().reason,
            mrbt::RejectReason::InsufficientCash);
  EXPECT_DOUBLE_EQ(result.state.cash, 10'000.0);
  EXPECT_TRUE(result.state.ledger.empty());
}

// Each buy takes about a tenth of what is left, so cash decays until sizing
// yields no shares. Every order either trades or is rejected untouched.
TEST_F(OrderExecutorTest, CashNeverGoesNegativeAcrossManyBuys) {
  mrbt::EngineState state = stateWithCash(1'000'000.0);
  std::size_t trades = 0;
  std::size_t rejections = 0;
  for (int i = 0; i < 200; ++i) {
    double cash_before = state.cash;
    auto result = executor().buy(
        std::move(state),
        request("T" + std::to_string(i), 37.0 + i % 13, "20240103",
                "20240102"));
    ASSERT_EQ(result.trades.size() + result.rejections.size(), 1u)
        << "buy " << i;
    if (!result.rejections.empty()) {
      EXPECT_DOUBLE_EQ(result.state.cash, cash_before) << "buy " << i;
    }
    trades += result.trades.size();
    rejections += result.rejections.size();
    state = std::move(result.state);
    ASSERT_GE(state.cash, 0.0) << "after buy " << i;
  }
  EXPECT_GT(rejections, 0u);
  EXPECT_EQ(trades + rejections, 200u);
  EXPECT_EQ(state.ledger.size(), trades);
}

// -----------------------------------------------------------------------------
// Re-entry within the window merges; at or past the window it is rejected.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, ReentryInsideWindowMergesAndRearmsStop) {
  auto first = executor().buy(stateWithCash(1'000'000.0),
                              request("2330", 50.0, "20240103", "20240102"));
  // elapsed(20240102, 20240116) = 14 < 15
  auto second = executor().buy(std::move(first.state),
                               request("2330", 55.0, "20240117", "20240116"));

  ASSERT_EQ(second.trades.size(), 1u);
  const auto* pos = second.state.ledger.position("2330");
  ASSERT_NE(pos, nullptr);
  EXPECT_GT(pos->shares, 2000);
  EXPECT_EQ(pos->entry_date, "20240117");
  EXPECT_EQ(pos->entry_signal_date, "20240116");

  const auto* stop = second.state.ledger.stopOrder("2330");
  ASSERT_NE(stop, nullptr);
  EXPECT_DOUBLE_EQ(stop->trigger_price, pos->weighted_cost * 0.9);
  EXPECT_EQ(stop->shares, pos->shares);
}

TEST_F(OrderExecutorTest, ReentryPastWindowIsRejected) {
  auto first = executor().buy(stateWithCash(1'000'000.0),
                              request("2330", 50.0, "20240103", "20240102"));
  double cash_after_first = first.state.cash;

  // elapsed(20240102, 20240117) = 15
  auto second = executor().buy(std::move(first.state),
                               request("2330", 55.0, "20240118", "20240117"));

  EXPECT_TRUE(second.trades.empty());
  ASSERT_EQ(second.rejections.size(), 1u);
  EXPECT_EQ(second.rejections.front().reason,
            mrbt::RejectReason::HoldingWindowElapsed);
  EXPECT_DOUBLE_EQ(second.state.cash, cash_after_first);
  EXPECT_EQ(second.state.ledger.position("2330")->shares, 2000);
}

// =============================================================================
// SELL
// =============================================================================

TEST_F(OrderExecutorTest, SellCreditsNetProceedsAndRecordsPnl) {
  auto bought = executor().buy(stateWithCash(1'000'000.0),
                               request("2330", 50.0, "20240103", "20240102"));
  auto sold = executor().sell(std::move(bought.state), "2330", 70.0,
                              "20240111", mrbt::domain::ExitReason::TakeProfit);

  ASSERT_EQ(sold.trades.size(), 1u);
  const auto& trade = sold.trades.front();
  double value = 2000 * 70.0;
  double fee = value * 0.001425;
  double tax = value * 0.003;

  EXPECT_EQ(trade.action, mrbt::domain::TradeAction::Sell);
  EXPECT_DOUBLE_EQ(trade.value, value);
  EXPECT_DOUBLE_EQ(trade.commission, fee);
  EXPECT_DOUBLE_EQ(trade.tax, tax);
  EXPECT_DOUBLE_EQ(trade.net_amount, value - fee - tax);
  EXPECT_DOUBLE_EQ(trade.entry_cost, 50.0);
  ASSERT_TRUE(trade.pnl.has_value());
  EXPECT_DOUBLE_EQ(*trade.pnl, value - fee - tax - 100'000.0);
  EXPECT_NEAR(*trade.pnl_pct, (value - fee - tax - 100'000.0) / 1000.0, 1e-9);
  EXPECT_EQ(trade.reason, mrbt::domain::ExitReason::TakeProfit);
  EXPECT_EQ(trade.holding_days, 8);

  EXPECT_DOUBLE_EQ(sold.state.cash, 899'857.5 + value - fee - tax);
  EXPECT_TRUE(sold.state.ledger.empty());
  EXPECT_TRUE(sold.state.ledger.stopOrders().empty());
}

TEST_F(OrderExecutorTest, SameDaySellUsesDayTradeTaxRate) {
  auto bought = executor().buy(stateWithCash(1'000'000.0),
                               request("2330", 50.0, "20240103", "20240102"));
  auto sold = executor().sell(std::move(bought.state), "2330", 45.0,
                              "20240103", mrbt::domain::ExitReason::StopLoss);

  ASSERT_EQ(sold.trades.size(), 1u);
  EXPECT_DOUBLE_EQ(sold.trades.front().tax, 2000 * 45.0 * 0.0015);
  EXPECT_EQ(sold.trades.front().holding_days, 0);
}

TEST_F(OrderExecutorTest, OddLotSellUsesOddLotMinimum) {
  auto bought = executor().buy(stateWithCash(1'000.0),
                               request("1101", 10.0, "20240103", "20240102"));
  auto sold = executor().sell(std::move(bought.state), "1101", 11.0,
                              "20240105", mrbt::domain::ExitReason::HoldingPeriod);

  ASSERT_EQ(sold.trades.size(), 1u);
  EXPECT_TRUE(sold.trades.front().is_odd_lot);
  EXPECT_DOUBLE_EQ(sold.trades.front().commission, 1.0);
}

TEST_F(OrderExecutorTest, SellWithoutPositionIsNoOp) {
  auto result = executor().sell(stateWithCash(500.0), "NONE", 10.0, "20240105",
                                mrbt::domain::ExitReason::HoldingPeriod);
  EXPECT_TRUE(result.trades.empty());
  EXPECT_DOUBLE_EQ(result.state.cash, 500.0);
}

// =============================================================================
// Limit orders
// =============================================================================

TEST_F(OrderExecutorTest, LimitOrderQueuesWithoutMovingCash) {
  auto placed = executor().placeLimitOrder(
      stateWithCash(1'000'000.0), request("2330", 50.0, "20240103", "20240102"));

  EXPECT_TRUE(placed.trades.empty());
  EXPECT_DOUBLE_EQ(placed.state.cash, 1'000'000.0);
  ASSERT_EQ(placed.state.pending_limit_orders.size(), 1u);
  EXPECT_EQ(placed.state.pending_limit_orders.front().shares, 2000);
  EXPECT_DOUBLE_EQ(placed.state.pending_limit_orders.front().limit_price, 50.0);
}

TEST_F(OrderExecutorTest, LimitOrderFillsWhenLowReachesLimit) {
  addBar("2330", "20240103", 49.0, 52.0);
  auto placed = executor().placeLimitOrder(
      stateWithCash(1'000'000.0), request("2330", 50.0, "20240103", "20240102"));
  auto filled =
      executor().fillLimitOrders(std::move(placed.state), "20240103", prices);

  ASSERT_EQ(filled.trades.size(), 1u);
  const auto& trade = filled.trades.front();
  EXPECT_DOUBLE_EQ(trade.price, 50.0);
  EXPECT_EQ(trade.shares, 2000);
  EXPECT_EQ(trade.entry_mode, mrbt::domain::EntryMode::LimitAtSignalOpen);
  EXPECT_DOUBLE_EQ(filled.state.cash, 899'857.5);
  EXPECT_TRUE(filled.state.pending_limit_orders.empty());
  EXPECT_NE(filled.state.ledger.stopOrder("2330"), nullptr);
}

TEST_F(OrderExecutorTest, LimitOrderExpiresWhenLowStaysAbove) {
  addBar("2330", "20240103", 51.0, 53.0);
  auto placed = executor().placeLimitOrder(
      stateWithCash(1'000'000.0), request("2330", 50.0, "20240103", "20240102"));
  auto result =
      executor().fillLimitOrders(std::move(placed.state), "20240103", prices);

  EXPECT_TRUE(result.trades.empty());
  ASSERT_EQ(result.rejections.size(), 1u);
  EXPECT_EQ(result.rejections.front().reason,
            mrbt::RejectReason::LimitNotReached);
  EXPECT_DOUBLE_EQ(result.state.cash, 1'000'000.0);
  EXPECT_TRUE(result.state.pending_limit_orders.empty());
}

TEST_F(OrderExecutorTest, LimitOrderExpiresWithoutBar) {
  auto placed = executor().placeLimitOrder(
      stateWithCash(1'000'000.0), request("2330", 50.0, "20240103", "20240102"));
  auto result =
      executor().fillLimitOrders(std::move(placed.state), "20240103", prices);

  ASSERT_EQ(result.rejections.size(), 1u);
  EXPECT_EQ(result.rejections.front().reason,
            mrbt::RejectReason::MissingPriceBar);
  EXPECT_TRUE(result.state.ledger.empty());
}

TEST_F(OrderExecutorTest, LimitOrderForLaterDateStaysQueued) {
  auto placed = executor().placeLimitOrder(
      stateWithCash(1'000'000.0), request("2330", 50.0, "20240104", "20240103"));
  auto result =
      executor().fillLimitOrders(std::move(placed.state), "20240103", prices);

  EXPECT_TRUE(result.trades.empty());
  EXPECT_TRUE(result.rejections.empty());
  EXPECT_EQ(result.state.pending_limit_orders.size(), 1u);
}
