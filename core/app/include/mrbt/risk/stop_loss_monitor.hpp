#pragma once

#include "mrbt/data/i_price_repository.hpp"
#include "mrbt/domain/position.hpp"
#include "mrbt/execution/order_executor.hpp"
#include "mrbt/state/engine_state.hpp"

namespace mrbt {

// -----------------------------------------------------------------------------
// StopLossMonitor
// -----------------------------------------------------------------------------
//
// @brief  Checks every standing stop order against the day's intraday low
//         and closes the positions whose stop was hit.
//
// @details
// A stop order triggers when bar.low <= trigger_price. The exit fills at
// the trigger price, not at the low, and is recorded with
// ExitReason::StopLoss.
//
// Tickers without a bar on the date (or with a non-positive low) are
// skipped; their stop stays armed for the next session.
//
// Runs after the day's entries and before the close-based exit rules, so a
// position closed here is never evaluated again the same day.
//
// Ownership:
//   Holds references to the price repository and the OrderExecutor. Both
//   are owned by BacktestEngine and outlive the monitor.
// -----------------------------------------------------------------------------
class StopLossMonitor {
 public:
  StopLossMonitor(const IPriceRepository& prices,
                  const OrderExecutor& executor);

  // True when the bar's low reached the stop's trigger price.
  static bool isTriggered(const domain::StopLossOrder& order,
                          const domain::PriceBar& bar);

  // -------------------------------------------------------------------------
  // check(state, date)
  // -------------------------------------------------------------------------
  // @brief  Runs one stop-loss pass for `date`.
  //
  // @return Next state with one SELL per triggered stop, in ticker order.
  // -------------------------------------------------------------------------
  StepResult check(EngineState state, const domain::TradeDate& date) const;

 private:
  const IPriceRepository& prices_;
  const OrderExecutor& executor_;
};

}  // namespace mrbt
