#pragma once

#include <cstddef>
#include <cstdint>

namespace mrbt {
namespace domain {

// -----------------------------------------------------------------------------
// CostSchedule: brokerage and exchange charges
// -----------------------------------------------------------------------------
//
// @brief  Commission and securities-transaction-tax rates applied by the
//         CostModel.
//
// @details
//   commission = max(value * commission_rate, minimum)
//     minimum = min_commission_odd_lot   when the order is an odd lot
//               min_commission_round_lot otherwise
//   tax        = value * (same-day round trip ? day_trade_tax_rate
//                                             : tax_rate)
//   Tax is charged on sells only.
// -----------------------------------------------------------------------------
struct CostSchedule {
  double commission_rate{0.001425};
  double min_commission_odd_lot{1.0};
  double min_commission_round_lot{20.0};
  double tax_rate{0.003};
  double day_trade_tax_rate{0.0015};
};

// -----------------------------------------------------------------------------
// StrategyParams: fixed rule constants plus the two run-time toggles
// -----------------------------------------------------------------------------
//
// @brief  Every threshold the simulation consults, collected in one value
//         type that is copied into each component at construction.
//
// @details
// The numeric defaults are the rule as it is traded and are not exposed on
// the command line. Only enable_take_profit and enable_stop_loss are
// switched per run (see BacktestConfig).
//
// Sign convention:
//   take_profit and stop_loss are POSITIVE fractions. The exit rules compare
//   return_pct >= take_profit and return_pct <= -stop_loss; the stop order
//   triggers at weighted_cost * (1 - stop_loss).
//
// Thread model:
//   Plain data with value semantics. No shared mutable state.
// -----------------------------------------------------------------------------
struct StrategyParams {
  /// Fraction of current cash committed to each new entry.
  double position_size_ratio{0.10};

  /// Trading days a position may be held, and the re-entry window length.
  int holding_period{15};

  /// Close-based return that triggers a take-profit exit.
  double take_profit{0.40};

  /// Loss fraction for both the standing stop order and the close check.
  double stop_loss{0.10};

  /// Stage-1 survivors kept by the SignalScanner.
  std::size_t top_n{10};

  /// Shares per board lot. Smaller orders trade as odd lots.
  std::int64_t board_lot{1000};

  bool enable_take_profit{true};
  bool enable_stop_loss{true};

  CostSchedule costs{};
};

}  // namespace domain
}  // namespace mrbt
