#pragma once

#include "mrbt/domain/portfolio_snapshot.hpp"
#include "mrbt/domain/trade.hpp"
#include "mrbt/state/engine_state.hpp"

#include <cstdint>

namespace mrbt {

// -----------------------------------------------------------------------------
// TradeEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces one BUY or SELL appended to the trade ledger.
// Published by BacktestEngine in ledger order, after the step that produced
// the trade has completed.
// -----------------------------------------------------------------------------
struct TradeEvent {
  domain::Trade trade;
  std::uint64_t sequence_id{0};  // Monotonic within one run
};

// -----------------------------------------------------------------------------
// OrderRejectEvent
// -----------------------------------------------------------------------------
// Responsibility: Announces an entry that did not execute (sizing to zero,
// insufficient cash, missing open, expired limit order, re-entry window).
// Rejections never change engine state; observers use them for logging and
// funnel statistics.
// -----------------------------------------------------------------------------
struct OrderRejectEvent {
  OrderRejection rejection;
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PortfolioSnapshotEvent
// -----------------------------------------------------------------------------
// Responsibility: End-of-day mark-to-market, one per simulated date.
// -----------------------------------------------------------------------------
struct PortfolioSnapshotEvent {
  domain::PortfolioSnapshot snapshot;
  std::uint64_t sequence_id{0};
};

}  // namespace mrbt
