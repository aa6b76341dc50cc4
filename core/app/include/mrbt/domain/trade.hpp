#pragma once

#include "mrbt/domain/trade_date.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mrbt {
namespace domain {

// -----------------------------------------------------------------------------
// TradeAction
// -----------------------------------------------------------------------------
enum class TradeAction {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// ExitReason: why a position was closed
// -----------------------------------------------------------------------------
enum class ExitReason {
  TakeProfit,     // close-based return reached the take-profit threshold
  StopLoss,       // intraday low hit the stop order, or close-based breach
  HoldingPeriod,  // held for the full holding period
};

// -----------------------------------------------------------------------------
// EntryMode: how a scanned candidate becomes a BUY
// -----------------------------------------------------------------------------
//
// MarketAtOpen       Unconditional fill at the next trading date's open.
// LimitAtSignalOpen  Limit order at the signal date's open, placed for the
//                    next trading date; fills at the limit price only if that
//                    date's low reaches it, otherwise expires.
// -----------------------------------------------------------------------------
enum class EntryMode {
  MarketAtOpen,
  LimitAtSignalOpen,
};

const char* toString(TradeAction action);
const char* toString(ExitReason reason);
const char* toString(EntryMode mode);

// Parses "market" / "limit". Returns std::nullopt for anything else.
std::optional<EntryMode> parseEntryMode(const std::string& text);

// -----------------------------------------------------------------------------
// Trade: append-only ledger record
// -----------------------------------------------------------------------------
//
// @brief  One executed BUY or SELL. Never mutated after it is appended.
//
// @details
// net_amount is the absolute cash movement of the trade:
//   BUY  → value + commission          (debited from cash)
//   SELL → value - commission - tax    (credited to cash)
//
// Sell-only fields (entry_cost, pnl, pnl_pct, reason, holding_days) are
// empty/zero on BUY records; buy-only fields (signal_date, entry_mode) are
// empty on SELL records.
// -----------------------------------------------------------------------------
struct Trade {
  TradeDate date;
  TradeAction action{TradeAction::Buy};
  std::string ticker;
  std::string display_name;
  std::int64_t shares{0};
  double price{0.0};
  double value{0.0};        // shares * price
  double commission{0.0};
  double tax{0.0};          // sells only
  double net_amount{0.0};
  bool is_odd_lot{false};

  // BUY
  TradeDate signal_date;
  std::optional<EntryMode> entry_mode;

  // SELL
  double entry_cost{0.0};   // weighted cost per share at exit
  std::optional<double> pnl;
  std::optional<double> pnl_pct;   // percent of cost basis
  std::optional<ExitReason> reason;
  int holding_days{0};
};

}  // namespace domain
}  // namespace mrbt
