#pragma once

#include "mrbt/domain/trade_date.hpp"

#include <cstddef>

namespace mrbt {
namespace domain {

// -----------------------------------------------------------------------------
// PortfolioSnapshot: end-of-day portfolio state
// -----------------------------------------------------------------------------
// One per simulated trading date, appended after that date's entries and
// exits have settled. portfolio_value = cash + sum(shares * close); a held
// ticker with no close on the date contributes nothing.
// -----------------------------------------------------------------------------
struct PortfolioSnapshot {
  TradeDate date;
  double cash{0.0};
  double portfolio_value{0.0};
  std::size_t open_position_count{0};
};

}  // namespace domain
}  // namespace mrbt
