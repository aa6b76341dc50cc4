#pragma once

#include "mrbt/domain/position.hpp"
#include "mrbt/domain/trade_date.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// PositionLedger: per-ticker open positions and their stop orders
// -----------------------------------------------------------------------------
//
// @brief  Stores at most one Position and at most one StopLossOrder per
//         ticker and implements the weighted-average cost merge.
//
// @details
// The ledger is a value type. EngineState holds one by value, and every step
// function receives a copy, mutates it and returns it inside the next
// state. Nothing outside the ledger can reach its maps except through the
// const accessors.
//
// Cost-basis math (long-only, so every fill increases the position):
//
//   First fill for a ticker:
//     shares        = fill_shares
//     weighted_cost = fill_price
//
//   Re-entry into an existing position:
//     new_shares        = old_shares + fill_shares
//     new_weighted_cost = (old_cost * old_shares + fill_price * fill_shares)
//                         / new_shares
//
// Exits are always full: close() removes the position and its stop order
// together, so a SELL can never leave an orphaned stop behind.
//
// Iteration order of positions() and stopOrders() is by ticker. The exit and
// stop-loss passes walk these maps, which keeps their output order
// reproducible across runs.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  using PositionMap = std::map<std::string, domain::Position>;
  using StopOrderMap = std::map<std::string, domain::StopLossOrder>;

  // -------------------------------------------------------------------------
  // position(ticker)
  // -------------------------------------------------------------------------
  // @brief  Returns a read-only pointer to the position for the ticker, or
  //         nullptr if none is open.
  //
  // @details
  // The pointer is invalidated by any non-const call on this ledger. Callers
  // use it within one expression or copy the Position out.
  // -------------------------------------------------------------------------
  const domain::Position* position(const std::string& ticker) const;

  bool contains(const std::string& ticker) const;

  // -------------------------------------------------------------------------
  // openOrMerge(...)
  // -------------------------------------------------------------------------
  // @brief  Applies a BUY fill: opens a new position or merges the fill into
  //         the existing one.
  //
  // @param  ticker        Instrument bought.
  // @param  display_name  Instrument name carried onto the position.
  // @param  shares        Filled share count, > 0.
  // @param  price         Fill price per share.
  // @param  entry_date    Trading date of the fill.
  // @param  signal_date   Trading date of the signal behind the fill.
  //
  // @return The position after the fill.
  //
  // @details
  // On merge, both entry_date and entry_signal_date move forward to this
  // fill, restarting the holding clock and the re-entry window. Any stop
  // order is left as-is; the caller re-arms it with armStopLoss() because
  // the weighted cost has changed.
  // -------------------------------------------------------------------------
  const domain::Position& openOrMerge(const std::string& ticker,
                                      const std::string& display_name,
                                      std::int64_t shares, double price,
                                      const domain::TradeDate& entry_date,
                                      const domain::TradeDate& signal_date);

  // -------------------------------------------------------------------------
  // armStopLoss(ticker, stop_loss_fraction)
  // -------------------------------------------------------------------------
  // @brief  (Re)places the stop order for an open position at
  //         weighted_cost * (1 - stop_loss_fraction), sized to the full
  //         share count. Replaces any previous order for the ticker.
  //
  // @return The armed order, or std::nullopt if no position is open.
  // -------------------------------------------------------------------------
  std::optional<domain::StopLossOrder> armStopLoss(const std::string& ticker,
                                                   double stop_loss_fraction);

  const domain::StopLossOrder* stopOrder(const std::string& ticker) const;

  // -------------------------------------------------------------------------
  // close(ticker)
  // -------------------------------------------------------------------------
  // @brief  Removes the position and any stop order for the ticker.
  //
  // @return The removed position, or std::nullopt if none was open.
  // -------------------------------------------------------------------------
  std::optional<domain::Position> close(const std::string& ticker);

  const PositionMap& positions() const { return positions_; }
  const StopOrderMap& stopOrders() const { return stop_orders_; }

  std::size_t size() const { return positions_.size(); }
  bool empty() const { return positions_.empty(); }

  // Snapshot copy of every open position, ordered by ticker.
  std::vector<domain::Position> snapshot() const;

  // -------------------------------------------------------------------------
  // mergedCost(old_cost, old_shares, fill_price, fill_shares)
  // -------------------------------------------------------------------------
  // @brief  Share-weighted average of the existing cost basis and a new
  //         fill. Both share counts must be positive.
  // -------------------------------------------------------------------------
  static double mergedCost(double old_cost, std::int64_t old_shares,
                           double fill_price, std::int64_t fill_shares);

 private:
  PositionMap positions_;
  StopOrderMap stop_orders_;
};

}  // namespace mrbt
