#pragma once

#include <string>

namespace mrbt {
namespace domain {

// -----------------------------------------------------------------------------
// TradeDate
// -----------------------------------------------------------------------------
// Responsibility: Identifies one trading session as an eight-digit "YYYYMMDD"
// string (e.g. "20240315").
//
// Why a string alias instead of a chrono type:
// - The upstream signal pipeline and the ZeroMQ feeder both emit dates in
//   this form; keeping it avoids conversion at every boundary.
// - Fixed-width digits sort lexicographically in calendar order, so
//   std::map / std::lower_bound work without a custom comparator.
// -----------------------------------------------------------------------------
using TradeDate = std::string;

// -----------------------------------------------------------------------------
// isTradeDate(text)
// -----------------------------------------------------------------------------
// @brief  Returns true if text is exactly eight ASCII digits with a month in
//         01..12 and a day in 01..31.
//
// @details
// Calendar validity (e.g. Feb 30) is not checked: the trading calendar is the
// source of truth for which dates exist.
// -----------------------------------------------------------------------------
inline bool isTradeDate(const std::string& text) {
  if (text.size() != 8) {
    return false;
  }
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  int month = (text[4] - '0') * 10 + (text[5] - '0');
  int day = (text[6] - '0') * 10 + (text[7] - '0');
  return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

}  // namespace domain
}  // namespace mrbt
