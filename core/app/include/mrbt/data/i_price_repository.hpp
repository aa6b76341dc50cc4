#pragma once

#include "mrbt/domain/signal_row.hpp"
#include "mrbt/domain/trade_date.hpp"

#include <optional>
#include <string>

namespace mrbt {

// -----------------------------------------------------------------------------
// IPriceRepository: read-only daily prices
// -----------------------------------------------------------------------------
// bar()   full OHLC, used where the intraday low matters (stop orders,
//         limit entries).
// close() settlement price, used by the exit rules and valuation.
// Both return std::nullopt for a data gap; callers skip the ticker for that
// date instead of treating the gap as an error.
// -----------------------------------------------------------------------------
class IPriceRepository {
 public:
  virtual ~IPriceRepository() = default;

  virtual std::optional<domain::PriceBar> bar(
      const std::string& ticker, const domain::TradeDate& date) const = 0;

  virtual std::optional<double> close(const std::string& ticker,
                                      const domain::TradeDate& date) const = 0;
};

}  // namespace mrbt
