#pragma once

#include "mrbt/calendar/i_trading_calendar.hpp"
#include "mrbt/data/i_price_repository.hpp"
#include "mrbt/domain/position.hpp"
#include "mrbt/domain/strategy_params.hpp"
#include "mrbt/domain/trade.hpp"
#include "mrbt/execution/order_executor.hpp"
#include "mrbt/state/engine_state.hpp"

#include <optional>

namespace mrbt {

// -----------------------------------------------------------------------------
// ExitEvaluator
// -----------------------------------------------------------------------------
//
// @brief  Applies the close-based exit rules to every open position and
//         sells the ones that qualify at the day's close.
//
// @details
// For each position with a close price on the date:
//
//   return = (close - weighted_cost) / weighted_cost
//
// Rules, first match wins:
//   1. TakeProfit     enable_take_profit and return >= take_profit
//   2. StopLoss       enable_stop_loss   and return <= -stop_loss
//   3. HoldingPeriod  elapsedTradingDays(entry_date, date) >= holding_period
//
// Positions with no close for the date are left untouched, including their
// holding-period check.
// -----------------------------------------------------------------------------
class ExitEvaluator {
 public:
  ExitEvaluator(const domain::StrategyParams& params,
                const ITradingCalendar& calendar,
                const IPriceRepository& prices,
                const OrderExecutor& executor);

  // Exit reason for one position at the given close, or std::nullopt to
  // keep holding.
  std::optional<domain::ExitReason> evaluate(const domain::Position& position,
                                             double close,
                                             const domain::TradeDate& date) const;

  // -------------------------------------------------------------------------
  // apply(state, date)
  // -------------------------------------------------------------------------
  // @brief  Evaluates every open position (ticker order) and sells the ones
  //         that hit a rule at that day's close.
  // -------------------------------------------------------------------------
  StepResult apply(EngineState state, const domain::TradeDate& date) const;

 private:
  const domain::StrategyParams params_;
  const ITradingCalendar& calendar_;
  const IPriceRepository& prices_;
  const OrderExecutor& executor_;
};

}  // namespace mrbt
