#pragma once

#include "mrbt/calendar/i_trading_calendar.hpp"
#include "mrbt/config/backtest_config.hpp"
#include "mrbt/data/i_price_repository.hpp"
#include "mrbt/data/i_signal_repository.hpp"
#include "mrbt/domain/portfolio_snapshot.hpp"
#include "mrbt/domain/strategy_params.hpp"
#include "mrbt/domain/trade.hpp"
#include "mrbt/eventbus/event_bus.hpp"
#include "mrbt/report/performance_report.hpp"
#include "mrbt/signal/signal_scanner.hpp"
#include "mrbt/state/engine_state.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// RunSettings: per-run switches layered over StrategyParams
// -----------------------------------------------------------------------------
struct RunSettings {
  bool enable_take_profit{true};
  bool enable_stop_loss{true};
  domain::EntryMode entry_mode{domain::EntryMode::MarketAtOpen};
};

// -----------------------------------------------------------------------------
// DayResult: one simulated trading date
// -----------------------------------------------------------------------------
struct DayResult {
  StepResult step;                      // state after the day, its trades
  domain::PortfolioSnapshot snapshot;   // end-of-day valuation
};

// -----------------------------------------------------------------------------
// BacktestResult
// -----------------------------------------------------------------------------
// total_return is a fraction of initial_capital. final_value is the last
// snapshot's portfolio value, or initial_capital when the window held no
// trading dates. Positions still open at the end are not liquidated; they
// are listed in open_positions, valued at their last close.
// -----------------------------------------------------------------------------
struct BacktestResult {
  std::vector<domain::Trade> trades;
  std::vector<domain::PortfolioSnapshot> snapshots;
  std::vector<OrderRejection> rejections;
  std::vector<OpenPositionSummary> open_positions;
  double initial_capital{0.0};
  double final_cash{0.0};
  double final_value{0.0};
  double total_return{0.0};
};

// -----------------------------------------------------------------------------
// BacktestEngine
// -----------------------------------------------------------------------------
//
// @brief  Drives the day-by-day simulation over a trading-date window.
//
// @details
// For each trading date T, in this order:
//
//   1. Entries     Candidates scanned on the previous date fill at T's open
//                  (market mode), or pending limit orders are resolved
//                  against T's low (limit mode).
//   2. Stop orders StopLossMonitor closes positions whose stop was hit by
//                  T's intraday low.
//   3. Rule exits  ExitEvaluator applies take-profit, stop-loss-on-close
//                  and holding-period at T's close.
//   4. Valuation   PortfolioValuator appends T's snapshot.
//   5. Scan        SignalScanner ranks T's signal rows; survivors are
//                  scheduled for the next trading date. Nothing is scheduled
//                  on the last date of the window.
//
// Every stage is a function from EngineState to StepResult; step() chains
// them for one date and run() folds step() over the window. After each date
// run() publishes TradeEvent, OrderRejectEvent and PortfolioSnapshotEvent on
// eventBus(), in that order.
//
// Thread model:
//   Single-threaded. run() executes on the caller's thread and EventBus
//   callbacks run synchronously inside it.
//
// Ownership:
//   Holds references to the calendar and both repositories; they must
//   outlive the engine. Owns the EventBus.
// -----------------------------------------------------------------------------
class BacktestEngine {
 public:
  BacktestEngine(const ITradingCalendar& calendar,
                 const ISignalRepository& signals,
                 const IPriceRepository& prices,
                 const domain::StrategyParams& params = {});

  BacktestEngine(const BacktestEngine&) = delete;
  BacktestEngine& operator=(const BacktestEngine&) = delete;

  // -------------------------------------------------------------------------
  // run(start, end, initial_capital, enable_take_profit, enable_stop_loss,
  //     entry_mode)
  // -------------------------------------------------------------------------
  // @brief  Simulates every trading date in [start, end] from a fresh state
  //         holding only initial_capital in cash.
  //
  // @details
  // An empty window is not an error: the result has no trades and no
  // snapshots, and final_value equals initial_capital. Throws
  // std::invalid_argument for a non-positive initial_capital.
  // -------------------------------------------------------------------------
  BacktestResult run(const domain::TradeDate& start,
                     const domain::TradeDate& end, double initial_capital,
                     bool enable_take_profit = true,
                     bool enable_stop_loss = true,
                     domain::EntryMode entry_mode =
                         domain::EntryMode::MarketAtOpen);

  BacktestResult run(const BacktestConfig& config);

  // -------------------------------------------------------------------------
  // step(state, date, is_last_date, settings)
  // -------------------------------------------------------------------------
  // @brief  Runs stages 1-5 for a single date. Publishes nothing.
  // -------------------------------------------------------------------------
  DayResult step(EngineState state, const domain::TradeDate& date,
                 bool is_last_date, const RunSettings& settings = {}) const;

  EventBus& eventBus() { return bus_; }

  const domain::StrategyParams& params() const { return params_; }

 private:
  static constexpr std::size_t kProgressInterval = 100;

  // StrategyParams with the run's toggles applied.
  domain::StrategyParams effectiveParams(const RunSettings& settings) const;

  // Stage 5: schedule or place entries for the candidates scanned on date.
  StepResult scheduleEntries(EngineState state, const domain::TradeDate& date,
                             const RunSettings& settings,
                             const domain::StrategyParams& params) const;

  // Stage 1, market mode: fill scheduled entries at date's open.
  StepResult executeScheduledEntries(EngineState state,
                                     const domain::TradeDate& date,
                                     const domain::StrategyParams& params) const;

  // Most recent close for the ticker on or before the last date in `dates`.
  std::optional<double> lastClose(
      const std::string& ticker,
      const std::vector<domain::TradeDate>& dates) const;

  const ITradingCalendar& calendar_;
  const ISignalRepository& signals_;
  const IPriceRepository& prices_;
  const domain::StrategyParams params_;
  const SignalScanner scanner_;

  EventBus bus_;
};

}  // namespace mrbt
