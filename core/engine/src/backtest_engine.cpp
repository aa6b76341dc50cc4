#include "mrbt/engine/backtest_engine.hpp"
#include "mrbt/execution/order_executor.hpp"
#include "mrbt/report/portfolio_valuator.hpp"
#include "mrbt/risk/exit_evaluator.hpp"
#include "mrbt/risk/stop_loss_monitor.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace mrbt {

BacktestEngine::BacktestEngine(const ITradingCalendar& calendar,
                               const ISignalRepository& signals,
                               const IPriceRepository& prices,
                               const domain::StrategyParams& params)
    : calendar_(calendar),
      signals_(signals),
      prices_(prices),
      params_(params),
      scanner_(params.top_n) {}

domain::StrategyParams BacktestEngine::effectiveParams(
    const RunSettings& settings) const {
  domain::StrategyParams params = params_;
  params.enable_take_profit = settings.enable_take_profit;
  params.enable_stop_loss = settings.enable_stop_loss;
  return params;
}

// -----------------------------------------------------------------------------
// step(): one trading date, stages 1-5
// -----------------------------------------------------------------------------
DayResult BacktestEngine::step(EngineState state,
                               const domain::TradeDate& date,
                               bool is_last_date,
                               const RunSettings& settings) const {
  const domain::StrategyParams params = effectiveParams(settings);
  OrderExecutor executor(params, calendar_);
  StopLossMonitor stop_monitor(prices_, executor);
  ExitEvaluator exit_evaluator(params, calendar_, prices_, executor);
  PortfolioValuator valuator(prices_);

  DayResult day;
  day.step.state = std::move(state);

  // 1) Entries from the previous date's scan.
  if (settings.entry_mode == domain::EntryMode::MarketAtOpen) {
    chain(day.step,
          executeScheduledEntries(std::move(day.step.state), date, params));
  } else {
    chain(day.step,
          executor.fillLimitOrders(std::move(day.step.state), date, prices_));
  }

  // 2) Standing stop orders against the intraday low.
  chain(day.step, stop_monitor.check(std::move(day.step.state), date));

  // 3) Close-based exit rules.
  chain(day.step, exit_evaluator.apply(std::move(day.step.state), date));

  // 4) Mark to market.
  day.snapshot = valuator.value(day.step.state, date);

  // 5) Scan today for tomorrow.
  if (!is_last_date) {
    chain(day.step, scheduleEntries(std::move(day.step.state), date, settings,
                                    params));
  }
  return day;
}

// -----------------------------------------------------------------------------
// executeScheduledEntries(): market fills at today's open
// -----------------------------------------------------------------------------
StepResult BacktestEngine::executeScheduledEntries(
    EngineState state, const domain::TradeDate& date,
    const domain::StrategyParams& params) const {
  OrderExecutor executor(params, calendar_);
  std::vector<ScheduledEntry> entries = std::move(state.scheduled_entries);
  state.scheduled_entries.clear();

  StepResult acc;
  acc.state = std::move(state);

  for (const auto& entry : entries) {
    auto row = signals_.signalRow(entry.ticker, date);
    if (!row || row->open <= 0.0) {
      acc.rejections.push_back(
          OrderRejection{date, entry.ticker, RejectReason::MissingOpenPrice});
      continue;
    }

    BuyRequest request;
    request.ticker = entry.ticker;
    request.display_name = entry.display_name;
    request.price = row->open;
    request.fill_date = date;
    request.signal_date = entry.signal_date;
    chain(acc, executor.buy(std::move(acc.state), request));
  }
  return acc;
}

// -----------------------------------------------------------------------------
// scheduleEntries(): scan and queue for the next trading date
// -----------------------------------------------------------------------------
StepResult BacktestEngine::scheduleEntries(
    EngineState state, const domain::TradeDate& date,
    const RunSettings& settings, const domain::StrategyParams& params) const {
  StepResult acc;
  acc.state = std::move(state);

  auto next_date = calendar_.nextTradingDate(date);
  if (!next_date) {
    return acc;
  }

  std::vector<Candidate> candidates = scanner_.scan(signals_.signalsOn(date));

  if (settings.entry_mode == domain::EntryMode::MarketAtOpen) {
    for (const auto& candidate : candidates) {
      acc.state.scheduled_entries.push_back(ScheduledEntry{
          candidate.row.ticker, candidate.row.display_name, date});
    }
    return acc;
  }

  // Limit mode: orders at today's open, sized from today's cash.
  OrderExecutor executor(params, calendar_);
  for (const auto& candidate : candidates) {
    if (candidate.row.open <= 0.0) {
      acc.rejections.push_back(OrderRejection{
          date, candidate.row.ticker, RejectReason::MissingOpenPrice});
      continue;
    }
    BuyRequest request;
    request.ticker = candidate.row.ticker;
    request.display_name = candidate.row.display_name;
    request.price = candidate.row.open;
    request.fill_date = *next_date;
    request.signal_date = date;
    chain(acc, executor.placeLimitOrder(std::move(acc.state), request));
  }
  return acc;
}

std::optional<double> BacktestEngine::lastClose(
    const std::string& ticker,
    const std::vector<domain::TradeDate>& dates) const {
  for (auto it = dates.rbegin(); it != dates.rend(); ++it) {
    if (auto close = prices_.close(ticker, *it)) {
      return close;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// run(): fold step() over the window and publish per-day events
// -----------------------------------------------------------------------------
BacktestResult BacktestEngine::run(const domain::TradeDate& start,
                                   const domain::TradeDate& end,
                                   double initial_capital,
                                   bool enable_take_profit,
                                   bool enable_stop_loss,
                                   domain::EntryMode entry_mode) {
  if (!(initial_capital > 0.0)) {
    throw std::invalid_argument("initial capital must be positive");
  }

  RunSettings settings;
  settings.enable_take_profit = enable_take_profit;
  settings.enable_stop_loss = enable_stop_loss;
  settings.entry_mode = entry_mode;

  BacktestResult result;
  result.initial_capital = initial_capital;

  std::vector<domain::TradeDate> dates = calendar_.tradingDates(start, end);
  std::cout << "[BacktestEngine] window " << start << ".." << end << ": "
            << dates.size() << " trading days, capital " << initial_capital
            << ", entry mode " << domain::toString(entry_mode)
            << ", take-profit " << (enable_take_profit ? "on" : "off")
            << ", stop-loss " << (enable_stop_loss ? "on" : "off") << "\n";

  EngineState state;
  state.cash = initial_capital;
  std::uint64_t sequence = 0;
  bus_.beginRun();

  for (std::size_t i = 0; i < dates.size(); ++i) {
    bool is_last = (i + 1 == dates.size());
    DayResult day = step(std::move(state), dates[i], is_last, settings);
    state = std::move(day.step.state);

    for (auto& trade : day.step.trades) {
      bus_.publish(TradeEvent{trade, ++sequence});
      result.trades.push_back(std::move(trade));
    }
    for (auto& rejection : day.step.rejections) {
      bus_.publish(OrderRejectEvent{rejection, ++sequence});
      result.rejections.push_back(std::move(rejection));
    }
    bus_.publish(PortfolioSnapshotEvent{day.snapshot, ++sequence});
    result.snapshots.push_back(day.snapshot);

    if ((i + 1) % kProgressInterval == 0) {
      std::cout << "[BacktestEngine] progress " << (i + 1) << "/"
                << dates.size() << " date=" << dates[i]
                << " value=" << day.snapshot.portfolio_value
                << " positions=" << day.snapshot.open_position_count << "\n";
    }
  }

  result.final_cash = state.cash;
  result.final_value = result.snapshots.empty()
                           ? initial_capital
                           : result.snapshots.back().portfolio_value;
  result.total_return = (result.final_value - initial_capital) / initial_capital;

  for (const auto& position : state.ledger.snapshot()) {
    OpenPositionSummary open;
    open.ticker = position.ticker;
    open.display_name = position.display_name;
    open.shares = position.shares;
    open.weighted_cost = position.weighted_cost;
    open.entry_date = position.entry_date;
    open.last_close = lastClose(position.ticker, dates);
    if (open.last_close) {
      open.market_value = static_cast<double>(open.shares) * *open.last_close;
    }

    std::cout << "[BacktestEngine] open at end: " << open.ticker << " "
              << open.shares << " shares, cost " << open.weighted_cost
              << ", last close "
              << (open.last_close ? std::to_string(*open.last_close) : "n/a")
              << ", value " << open.market_value << "\n";
    result.open_positions.push_back(std::move(open));
  }

  std::cout << "[BacktestEngine] done: " << result.trades.size()
            << " trades, final value " << result.final_value << "\n";
  return result;
}

BacktestResult BacktestEngine::run(const BacktestConfig& config) {
  return run(config.start_date, config.end_date, config.initial_capital,
             config.enable_take_profit, config.enable_stop_loss,
             config.entry_mode);
}

}  // namespace mrbt
