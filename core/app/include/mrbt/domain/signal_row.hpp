#pragma once

#include "mrbt/domain/trade_date.hpp"

#include <string>

namespace mrbt {
namespace domain {

// -----------------------------------------------------------------------------
// SignalRow: one instrument's daily analytic record
// -----------------------------------------------------------------------------
//
// @brief  The per-(ticker, date) row produced by the upstream margin-ratio
//         pipeline and consumed read-only by the SignalScanner.
//
// @details
// Field meanings:
//   ratio                  margin maintenance ratio on `date`
//   avg10_ratio            10-day moving average of ratio
//   volume / avg10_volume  traded volume and its 10-day moving average
//   open / close           session open and close prices
//   balance_shares         outstanding margin balance (shares)
//   avg5_balance_threshold 5-day average balance scaled by 0.95
//
// The engine never mutates a SignalRow. Rows with a missing analytic field
// are still kept by the repository for open/close lookups but never reach
// the scanner (see MarketDataStore::signalsOn()).
// -----------------------------------------------------------------------------
struct SignalRow {
  std::string ticker;
  std::string display_name;       // Human-readable instrument name
  TradeDate date;
  double ratio{0.0};
  double avg10_ratio{0.0};
  double volume{0.0};
  double avg10_volume{0.0};
  double open{0.0};
  double close{0.0};
  double balance_shares{0.0};
  double avg5_balance_threshold{0.0};
};

// -----------------------------------------------------------------------------
// PriceBar: daily OHLC for one instrument
// -----------------------------------------------------------------------------
// Owned by the price collaborator. The StopLossMonitor reads `low`; limit
// entries read `low` on the fill date.
// -----------------------------------------------------------------------------
struct PriceBar {
  std::string ticker;
  TradeDate date;
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
};

}  // namespace domain
}  // namespace mrbt
