#pragma once

#include "mrbt/domain/signal_row.hpp"
#include "mrbt/domain/trade_date.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// ISignalRepository: read-only access to the upstream signal table
// -----------------------------------------------------------------------------
//
// @brief  Abstracts where SignalRows come from (JSON snapshot, ZeroMQ feed,
//         test fixture) so the engine only sees the two queries it needs.
//
// @details
// signalsOn(date) returns only rows that are complete (every analytic field
// present) and have balance_shares > 0. These are the scanner's input.
//
// signalRow(ticker, date) returns the row for one instrument regardless of
// completeness. The entry path uses it to read the next session's open.
//
// Implementations are treated as ground truth for the dates they cover. Any
// retries or repairs happen before the engine is constructed.
// -----------------------------------------------------------------------------
class ISignalRepository {
 public:
  virtual ~ISignalRepository() = default;

  virtual std::vector<domain::SignalRow> signalsOn(
      const domain::TradeDate& date) const = 0;

  virtual std::optional<domain::SignalRow> signalRow(
      const std::string& ticker, const domain::TradeDate& date) const = 0;
};

}  // namespace mrbt
