#pragma once

#include "mrbt/domain/trade_date.hpp"

#include <cstdint>
#include <string>

namespace mrbt {
namespace domain {

// -----------------------------------------------------------------------------
// Position: long holding in a single instrument
// -----------------------------------------------------------------------------
//
// @brief  Tracks share count, weighted-average cost basis and the two dates
//         that drive the holding clock for one ticker.
//
// @details
// The strategy is long-only, so shares is always positive while the position
// exists. A position is created on the first BUY, merged on re-entry and
// erased on a full SELL; there is no partial close.
//
// weighted_cost is the share-weighted average price of every buy tranche
// still held:
//   new_cost = (old_cost * old_shares + fill_price * fill_shares)
//              / (old_shares + fill_shares)
//
// entry_date        trading date of the most recent fill; the holding-period
//                   exit counts from here.
// entry_signal_date trading date of the signal behind the most recent fill;
//                   the re-entry window counts from here.
//
// Ownership:
//   PositionLedger owns the authoritative copy. Events and results carry
//   value copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string ticker;
  std::string display_name;
  std::int64_t shares{0};
  double weighted_cost{0.0};
  TradeDate entry_date;
  TradeDate entry_signal_date;
};

// -----------------------------------------------------------------------------
// StopLossOrder: standing conditional sell for one position
// -----------------------------------------------------------------------------
// Exists only while the matching Position exists and stop-loss is enabled.
// Re-armed in full whenever the position's weighted cost changes.
// -----------------------------------------------------------------------------
struct StopLossOrder {
  std::string ticker;
  double trigger_price{0.0};
  std::int64_t shares{0};
};

}  // namespace domain
}  // namespace mrbt
