#pragma once

#include "mrbt/domain/strategy_params.hpp"

namespace mrbt {

// -----------------------------------------------------------------------------
// CostModel: commission and transaction tax
// -----------------------------------------------------------------------------
//
// @brief  Pure functions over a trade's notional value. No state, no side
//         effects; safe to call from anywhere.
//
// @details
// Inputs are expected to be non-negative. A zero-value trade still pays the
// minimum commission, which is why OrderExecutor rejects zero-share orders
// before it ever prices them.
// -----------------------------------------------------------------------------
namespace cost {

// -------------------------------------------------------------------------
// commission(value, is_odd_lot, schedule)
// -------------------------------------------------------------------------
// @brief  max(value * commission_rate, minimum) where minimum is the odd-lot
//         or round-lot floor from the schedule.
// -------------------------------------------------------------------------
double commission(double value, bool is_odd_lot,
                  const domain::CostSchedule& schedule = {});

// -------------------------------------------------------------------------
// transactionTax(value, is_same_day_trade, schedule)
// -------------------------------------------------------------------------
// @brief  Securities transaction tax on a SELL of the given value.
//
// @details
// The reduced day-trade rate applies when the position being sold was
// entered on the same trading date. Callers never apply this to buys.
// -------------------------------------------------------------------------
double transactionTax(double value, bool is_same_day_trade,
                      const domain::CostSchedule& schedule = {});

}  // namespace cost
}  // namespace mrbt
