#pragma once

#include "mrbt/data/i_price_repository.hpp"
#include "mrbt/domain/portfolio_snapshot.hpp"
#include "mrbt/state/engine_state.hpp"

namespace mrbt {

// -----------------------------------------------------------------------------
// PortfolioValuator: daily mark-to-market
// -----------------------------------------------------------------------------
// value = cash + Σ shares × close. A position with no close on the date
// contributes 0 for that day; it is still counted as open.
// -----------------------------------------------------------------------------
class PortfolioValuator {
 public:
  explicit PortfolioValuator(const IPriceRepository& prices);

  domain::PortfolioSnapshot value(const EngineState& state,
                                  const domain::TradeDate& date) const;

 private:
  const IPriceRepository& prices_;
};

}  // namespace mrbt
