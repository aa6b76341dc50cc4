#include "mrbt/report/portfolio_valuator.hpp"

namespace mrbt {

PortfolioValuator::PortfolioValuator(const IPriceRepository& prices)
    : prices_(prices) {}

domain::PortfolioSnapshot PortfolioValuator::value(
    const EngineState& state, const domain::TradeDate& date) const {
  double holdings = 0.0;
  for (const auto& entry : state.ledger.positions()) {
    const domain::Position& pos = entry.second;
    if (auto close = prices_.close(pos.ticker, date)) {
      holdings += static_cast<double>(pos.shares) * *close;
    }
  }

  domain::PortfolioSnapshot snapshot;
  snapshot.date = date;
  snapshot.cash = state.cash;
  snapshot.portfolio_value = state.cash + holdings;
  snapshot.open_position_count = state.ledger.size();
  return snapshot;
}

}  // namespace mrbt
