#pragma once

#include "mrbt/domain/trade.hpp"
#include "mrbt/domain/trade_date.hpp"
#include "mrbt/ledger/position_ledger.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// ScheduledEntry: a scanned candidate waiting for the next session's open
// -----------------------------------------------------------------------------
struct ScheduledEntry {
  std::string ticker;
  std::string display_name;
  domain::TradeDate signal_date;
};

// -----------------------------------------------------------------------------
// PendingLimitOrder: a limit buy placed on the signal date
// -----------------------------------------------------------------------------
// Sized and cash-checked when placed; cash is only debited if it fills on
// fill_date. Orders not filled on fill_date expire.
// -----------------------------------------------------------------------------
struct PendingLimitOrder {
  std::string ticker;
  std::string display_name;
  domain::TradeDate signal_date;
  domain::TradeDate fill_date;
  double limit_price{0.0};
  std::int64_t shares{0};
  bool is_odd_lot{false};
};

// -----------------------------------------------------------------------------
// RejectReason: why an entry produced no BUY
// -----------------------------------------------------------------------------
enum class RejectReason {
  NoShares,               // sizing rounded to zero shares
  InsufficientCash,       // total cost exceeds available cash
  MissingOpenPrice,       // no signal row / open for the fill date
  HoldingWindowElapsed,   // existing position is past its re-entry window
  LimitNotReached,        // limit order: day's low stayed above the limit
  MissingPriceBar,        // limit order: no bar on the fill date
};

const char* toString(RejectReason reason);

// -----------------------------------------------------------------------------
// OrderRejection: record of an entry that did not execute
// -----------------------------------------------------------------------------
// Rejections never change state. They are returned alongside trades so the
// run loop can publish them for logging and funnel statistics.
// -----------------------------------------------------------------------------
struct OrderRejection {
  domain::TradeDate date;
  std::string ticker;
  RejectReason reason{RejectReason::NoShares};
};

// -----------------------------------------------------------------------------
// EngineState: everything the simulation mutates
// -----------------------------------------------------------------------------
//
// @brief  Cash, the position ledger and the two entry queues, held as one
//         value.
//
// @details
// Each step of a trading day (entries, stop-loss checks, rule exits) is a
// function taking an EngineState by value and returning the next state in a
// StepResult together with the trades it emitted. Nothing else holds
// mutable simulation state, so any single step can be exercised in a test
// from a hand-built state.
//
// Invariant: cash >= 0. Every debit is preceded by a sufficiency check.
// -----------------------------------------------------------------------------
struct EngineState {
  double cash{0.0};
  PositionLedger ledger;
  std::vector<ScheduledEntry> scheduled_entries;
  std::vector<PendingLimitOrder> pending_limit_orders;
};

// -----------------------------------------------------------------------------
// StepResult: output of one state transition
// -----------------------------------------------------------------------------
struct StepResult {
  EngineState state;
  std::vector<domain::Trade> trades;
  std::vector<OrderRejection> rejections;
};

// -------------------------------------------------------------------------
// chain(acc, next)
// -------------------------------------------------------------------------
// @brief  Folds `next` into `acc`: adopts next.state and appends its trades
//         and rejections in order.
// -------------------------------------------------------------------------
inline void chain(StepResult& acc, StepResult next) {
  acc.state = std::move(next.state);
  for (auto& trade : next.trades) {
    acc.trades.push_back(std::move(trade));
  }
  for (auto& rejection : next.rejections) {
    acc.rejections.push_back(std::move(rejection));
  }
}

}  // namespace mrbt
