#include "mrbt/calendar/trading_calendar.hpp"

#include <algorithm>
#include <iterator>

namespace mrbt {

TradingCalendar::TradingCalendar(std::vector<domain::TradeDate> dates)
    : dates_(std::move(dates)) {
  std::sort(dates_.begin(), dates_.end());
  dates_.erase(std::unique(dates_.begin(), dates_.end()), dates_.end());
}

// -----------------------------------------------------------------------------
// tradingDates: closed window [start, end]
// -----------------------------------------------------------------------------
std::vector<domain::TradeDate> TradingCalendar::tradingDates(
    const domain::TradeDate& start, const domain::TradeDate& end) const {
  if (end < start) {
    return {};
  }
  auto first = std::lower_bound(dates_.begin(), dates_.end(), start);
  auto last = std::upper_bound(dates_.begin(), dates_.end(), end);
  return std::vector<domain::TradeDate>(first, last);
}

// -----------------------------------------------------------------------------
// elapsedTradingDays: count of dates in (from, to]
// -----------------------------------------------------------------------------
int TradingCalendar::elapsedTradingDays(const domain::TradeDate& from,
                                        const domain::TradeDate& to) const {
  if (to <= from) {
    return 0;
  }
  auto first = std::upper_bound(dates_.begin(), dates_.end(), from);
  auto last = std::upper_bound(dates_.begin(), dates_.end(), to);
  return static_cast<int>(std::distance(first, last));
}

std::optional<domain::TradeDate> TradingCalendar::nextTradingDate(
    const domain::TradeDate& date) const {
  auto it = std::upper_bound(dates_.begin(), dates_.end(), date);
  if (it == dates_.end()) {
    return std::nullopt;
  }
  return *it;
}

}  // namespace mrbt
