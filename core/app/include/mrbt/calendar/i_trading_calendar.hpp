#pragma once

#include "mrbt/domain/trade_date.hpp"

#include <optional>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// ITradingCalendar: abstract source of trading dates
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface answering "which dates trade" and "how many
//         trading days lie between two dates".
//
// @details
// Every time-based rule in the simulation is phrased in trading days, not
// calendar days: the holding period, the re-entry window and the "next
// session" an entry fills on. Injecting the calendar keeps those rules
// deterministic and lets tests build a calendar from a handful of dates.
//
// elapsedTradingDays(from, to) counts calendar dates d with
//   from < d <= to
// so a position entered on `from` has 0 elapsed days on `from` itself and 1
// on the next session. Dates absent from the calendar still compare by
// value, so the count is well defined for any pair.
//
// Ownership:
//   Components hold a const reference; they do NOT own the calendar. Its
//   lifetime must exceed the engine's.
// -----------------------------------------------------------------------------
class ITradingCalendar {
 public:
  virtual ~ITradingCalendar() = default;

  // -------------------------------------------------------------------------
  // tradingDates(start, end)
  // -------------------------------------------------------------------------
  // @brief  Ordered trading dates in [start, end], both inclusive. Empty if
  //         start > end or nothing trades in the window.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::TradeDate> tradingDates(
      const domain::TradeDate& start, const domain::TradeDate& end) const = 0;

  // -------------------------------------------------------------------------
  // elapsedTradingDays(from, to)
  // -------------------------------------------------------------------------
  // @brief  Number of trading dates strictly after `from` up to and
  //         including `to`. Zero when to <= from.
  // -------------------------------------------------------------------------
  virtual int elapsedTradingDays(const domain::TradeDate& from,
                                 const domain::TradeDate& to) const = 0;

  // -------------------------------------------------------------------------
  // nextTradingDate(date)
  // -------------------------------------------------------------------------
  // @brief  First trading date strictly after `date`, or std::nullopt if
  //         `date` is at or beyond the end of the calendar.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::TradeDate> nextTradingDate(
      const domain::TradeDate& date) const = 0;
};

}  // namespace mrbt
