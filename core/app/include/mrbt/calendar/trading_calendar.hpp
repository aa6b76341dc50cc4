#pragma once

#include "mrbt/calendar/i_trading_calendar.hpp"

#include <cstddef>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// TradingCalendar: sorted list of session dates
// -----------------------------------------------------------------------------
//
// @brief  ITradingCalendar backed by an in-memory, sorted, de-duplicated
//         vector of dates.
//
// @details
// In a backtest the calendar is the set of distinct dates present in the
// signal table (MarketDataStore::signalDates()). Counting against that set,
// rather than against one ticker's own rows, means a ticker with a gap in
// its data still ages by the market's clock.
//
// All queries are binary searches over dates_.
// -----------------------------------------------------------------------------
class TradingCalendar final : public ITradingCalendar {
 public:
  TradingCalendar() = default;

  // Accepts dates in any order; duplicates are removed.
  explicit TradingCalendar(std::vector<domain::TradeDate> dates);

  std::vector<domain::TradeDate> tradingDates(
      const domain::TradeDate& start,
      const domain::TradeDate& end) const override;

  int elapsedTradingDays(const domain::TradeDate& from,
                         const domain::TradeDate& to) const override;

  std::optional<domain::TradeDate> nextTradingDate(
      const domain::TradeDate& date) const override;

  const std::vector<domain::TradeDate>& dates() const { return dates_; }
  std::size_t size() const { return dates_.size(); }
  bool empty() const { return dates_.empty(); }

 private:
  std::vector<domain::TradeDate> dates_;
};

}  // namespace mrbt
