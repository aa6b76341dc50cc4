#include "mrbt/ledger/position_ledger.hpp"

namespace mrbt {

// -----------------------------------------------------------------------------
// position / contains: read-only lookups
// -----------------------------------------------------------------------------
const domain::Position* PositionLedger::position(
    const std::string& ticker) const {
  auto it = positions_.find(ticker);
  return (it != positions_.end()) ? &it->second : nullptr;
}

bool PositionLedger::contains(const std::string& ticker) const {
  return positions_.count(ticker) != 0;
}

// -----------------------------------------------------------------------------
// openOrMerge: apply a BUY fill
// -----------------------------------------------------------------------------
const domain::Position& PositionLedger::openOrMerge(
    const std::string& ticker, const std::string& display_name,
    std::int64_t shares, double price, const domain::TradeDate& entry_date,
    const domain::TradeDate& signal_date) {
  auto it = positions_.find(ticker);

  // --- First fill: position starts at the fill price ------------------------
  if (it == positions_.end()) {
    domain::Position pos;
    pos.ticker = ticker;
    pos.display_name = display_name;
    pos.shares = shares;
    pos.weighted_cost = price;
    pos.entry_date = entry_date;
    pos.entry_signal_date = signal_date;
    return positions_.emplace(ticker, std::move(pos)).first->second;
  }

  // --- Re-entry: blend cost basis, restart both clocks ----------------------
  domain::Position& pos = it->second;
  pos.weighted_cost = mergedCost(pos.weighted_cost, pos.shares, price, shares);
  pos.shares += shares;
  pos.entry_date = entry_date;
  pos.entry_signal_date = signal_date;
  if (!display_name.empty()) {
    pos.display_name = display_name;
  }
  return pos;
}

// -----------------------------------------------------------------------------
// armStopLoss: replace the stop order from the current cost basis
// -----------------------------------------------------------------------------
std::optional<domain::StopLossOrder> PositionLedger::armStopLoss(
    const std::string& ticker, double stop_loss_fraction) {
  const domain::Position* pos = position(ticker);
  if (pos == nullptr) {
    return std::nullopt;
  }

  domain::StopLossOrder order;
  order.ticker = ticker;
  order.trigger_price = pos->weighted_cost * (1.0 - stop_loss_fraction);
  order.shares = pos->shares;

  stop_orders_[ticker] = order;
  return order;
}

const domain::StopLossOrder* PositionLedger::stopOrder(
    const std::string& ticker) const {
  auto it = stop_orders_.find(ticker);
  return (it != stop_orders_.end()) ? &it->second : nullptr;
}

// -----------------------------------------------------------------------------
// close: full exit removes position and stop together
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionLedger::close(
    const std::string& ticker) {
  auto it = positions_.find(ticker);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  domain::Position closed = std::move(it->second);
  positions_.erase(it);
  stop_orders_.erase(ticker);
  return closed;
}

std::vector<domain::Position> PositionLedger::snapshot() const {
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [ticker, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

// -----------------------------------------------------------------------------
// mergedCost: share-weighted average of two tranches
// -----------------------------------------------------------------------------
double PositionLedger::mergedCost(double old_cost, std::int64_t old_shares,
                                  double fill_price,
                                  std::int64_t fill_shares) {
  // Both counts are positive (long-only), so the sum is never zero.
  double total = static_cast<double>(old_shares + fill_shares);
  return (old_cost * static_cast<double>(old_shares) +
          fill_price * static_cast<double>(fill_shares)) /
         total;
}

}  // namespace mrbt
