#include "mrbt/execution/order_executor.hpp"
#include "mrbt/cost/cost_model.hpp"

#include <cmath>

namespace mrbt {

namespace {

StepResult rejected(EngineState state, const domain::TradeDate& date,
                    const std::string& ticker, RejectReason reason) {
  StepResult result;
  result.state = std::move(state);
  result.rejections.push_back(OrderRejection{date, ticker, reason});
  return result;
}

}  // namespace

OrderExecutor::OrderExecutor(const domain::StrategyParams& params,
                             const ITradingCalendar& calendar)
    : params_(params), calendar_(calendar) {}

// -----------------------------------------------------------------------------
// sizeOrder: fixed-fraction notional, board-lot rounding
// -----------------------------------------------------------------------------
LotSizing OrderExecutor::sizeOrder(double cash, double price) const {
  LotSizing sizing;
  if (price <= 0.0 || cash <= 0.0) {
    return sizing;
  }

  double notional = cash * params_.position_size_ratio;
  auto raw_shares = static_cast<std::int64_t>(std::floor(notional / price));

  if (raw_shares < params_.board_lot) {
    // Cannot afford a full lot: trade the remainder as an odd lot.
    sizing.shares = raw_shares;
    sizing.is_odd_lot = true;
  } else {
    sizing.shares = (raw_shares / params_.board_lot) * params_.board_lot;
    sizing.is_odd_lot = false;
  }
  return sizing;
}

bool OrderExecutor::reentryWindowElapsed(
    const EngineState& state, const std::string& ticker,
    const domain::TradeDate& signal_date) const {
  const domain::Position* pos = state.ledger.position(ticker);
  if (pos == nullptr) {
    return false;
  }
  int elapsed =
      calendar_.elapsedTradingDays(pos->entry_signal_date, signal_date);
  return elapsed >= params_.holding_period;
}

// -----------------------------------------------------------------------------
// buy: market entry
// -----------------------------------------------------------------------------
StepResult OrderExecutor::buy(EngineState state,
                              const BuyRequest& request) const {
  if (reentryWindowElapsed(state, request.ticker, request.signal_date)) {
    return rejected(std::move(state), request.fill_date, request.ticker,
                    RejectReason::HoldingWindowElapsed);
  }

  LotSizing sizing = sizeOrder(state.cash, request.price);
  if (sizing.shares <= 0) {
    return rejected(std::move(state), request.fill_date, request.ticker,
                    RejectReason::NoShares);
  }

  return executeBuy(std::move(state), request, sizing,
                    domain::EntryMode::MarketAtOpen);
}

// -----------------------------------------------------------------------------
// executeBuy: cash check, debit, ledger update, BUY record
// -----------------------------------------------------------------------------
StepResult OrderExecutor::executeBuy(EngineState state,
                                     const BuyRequest& request,
                                     LotSizing sizing,
                                     domain::EntryMode mode) const {
  double value = static_cast<double>(sizing.shares) * request.price;
  double fee = cost::commission(value, sizing.is_odd_lot, params_.costs);
  double total_cost = value + fee;

  if (total_cost > state.cash) {
    return rejected(std::move(state), request.fill_date, request.ticker,
                    RejectReason::InsufficientCash);
  }

  state.cash -= total_cost;
  state.ledger.openOrMerge(request.ticker, request.display_name, sizing.shares,
                           request.price, request.fill_date,
                           request.signal_date);

  if (params_.enable_stop_loss) {
    state.ledger.armStopLoss(request.ticker, params_.stop_loss);
  }

  domain::Trade trade;
  trade.date = request.fill_date;
  trade.action = domain::TradeAction::Buy;
  trade.ticker = request.ticker;
  trade.display_name = request.display_name;
  trade.shares = sizing.shares;
  trade.price = request.price;
  trade.value = value;
  trade.commission = fee;
  trade.net_amount = total_cost;
  trade.is_odd_lot = sizing.is_odd_lot;
  trade.signal_date = request.signal_date;
  trade.entry_mode = mode;

  StepResult result;
  result.state = std::move(state);
  result.trades.push_back(std::move(trade));
  return result;
}

// -----------------------------------------------------------------------------
// sell: full exit at the given price
// -----------------------------------------------------------------------------
StepResult OrderExecutor::sell(EngineState state, const std::string& ticker,
                               double price, const domain::TradeDate& date,
                               domain::ExitReason reason) const {
  std::optional<domain::Position> closed = state.ledger.close(ticker);
  if (!closed) {
    StepResult unchanged;
    unchanged.state = std::move(state);
    return unchanged;
  }

  const domain::Position& pos = *closed;
  double value = static_cast<double>(pos.shares) * price;
  bool is_odd_lot = pos.shares < params_.board_lot;
  bool same_day = pos.entry_date == date;

  double fee = cost::commission(value, is_odd_lot, params_.costs);
  double tax = cost::transactionTax(value, same_day, params_.costs);
  double net_proceeds = value - fee - tax;

  state.cash += net_proceeds;

  double cost_basis = pos.weighted_cost * static_cast<double>(pos.shares);
  double pnl = net_proceeds - cost_basis;

  domain::Trade trade;
  trade.date = date;
  trade.action = domain::TradeAction::Sell;
  trade.ticker = pos.ticker;
  trade.display_name = pos.display_name;
  trade.shares = pos.shares;
  trade.price = price;
  trade.value = value;
  trade.commission = fee;
  trade.tax = tax;
  trade.net_amount = net_proceeds;
  trade.is_odd_lot = is_odd_lot;
  trade.entry_cost = pos.weighted_cost;
  trade.pnl = pnl;
  trade.pnl_pct = (cost_basis > 0.0) ? pnl / cost_basis * 100.0 : 0.0;
  trade.reason = reason;
  trade.holding_days = calendar_.elapsedTradingDays(pos.entry_date, date);

  StepResult result;
  result.state = std::move(state);
  result.trades.push_back(std::move(trade));
  return result;
}

// -----------------------------------------------------------------------------
// placeLimitOrder: size and queue, no cash movement
// -----------------------------------------------------------------------------
StepResult OrderExecutor::placeLimitOrder(EngineState state,
                                          const BuyRequest& request) const {
  if (reentryWindowElapsed(state, request.ticker, request.signal_date)) {
    return rejected(std::move(state), request.signal_date, request.ticker,
                    RejectReason::HoldingWindowElapsed);
  }

  LotSizing sizing = sizeOrder(state.cash, request.price);
  if (sizing.shares <= 0) {
    return rejected(std::move(state), request.signal_date, request.ticker,
                    RejectReason::NoShares);
  }

  double value = static_cast<double>(sizing.shares) * request.price;
  double total_cost =
      value + cost::commission(value, sizing.is_odd_lot, params_.costs);
  if (total_cost > state.cash) {
    return rejected(std::move(state), request.signal_date, request.ticker,
                    RejectReason::InsufficientCash);
  }

  PendingLimitOrder order;
  order.ticker = request.ticker;
  order.display_name = request.display_name;
  order.signal_date = request.signal_date;
  order.fill_date = request.fill_date;
  order.limit_price = request.price;
  order.shares = sizing.shares;
  order.is_odd_lot = sizing.is_odd_lot;
  state.pending_limit_orders.push_back(std::move(order));

  StepResult result;
  result.state = std::move(state);
  return result;
}

// -----------------------------------------------------------------------------
// fillLimitOrders: resolve orders due today against the day's low
// -----------------------------------------------------------------------------
StepResult OrderExecutor::fillLimitOrders(
    EngineState state, const domain::TradeDate& date,
    const IPriceRepository& prices) const {
  std::vector<PendingLimitOrder> due;
  std::vector<PendingLimitOrder> waiting;
  for (auto& order : state.pending_limit_orders) {
    if (order.fill_date <= date) {
      due.push_back(std::move(order));
    } else {
      waiting.push_back(std::move(order));
    }
  }
  state.pending_limit_orders = std::move(waiting);

  StepResult acc;
  acc.state = std::move(state);

  for (const auto& order : due) {
    std::optional<domain::PriceBar> bar;
    if (order.fill_date == date) {
      bar = prices.bar(order.ticker, date);
    }
    if (!bar || bar->low <= 0.0) {
      acc.rejections.push_back(
          OrderRejection{date, order.ticker, RejectReason::MissingPriceBar});
      continue;
    }
    if (bar->low > order.limit_price) {
      acc.rejections.push_back(
          OrderRejection{date, order.ticker, RejectReason::LimitNotReached});
      continue;
    }

    BuyRequest request;
    request.ticker = order.ticker;
    request.display_name = order.display_name;
    request.price = order.limit_price;
    request.fill_date = date;
    request.signal_date = order.signal_date;

    chain(acc, executeBuy(std::move(acc.state), request,
                          LotSizing{order.shares, order.is_odd_lot},
                          domain::EntryMode::LimitAtSignalOpen));
  }
  return acc;
}

}  // namespace mrbt
