#include "mrbt/signal/signal_scanner.hpp"

#include <algorithm>

namespace mrbt {

SignalScanner::SignalScanner(std::size_t top_n) : top_n_(top_n) {}

// -----------------------------------------------------------------------------
// dropPct: stage 1 for one row
// -----------------------------------------------------------------------------
std::optional<double> SignalScanner::dropPct(const domain::SignalRow& row) {
  if (row.balance_shares <= 0.0 || row.avg10_ratio <= 0.0) {
    return std::nullopt;
  }
  if (row.ratio >= row.avg10_ratio) {
    return std::nullopt;
  }
  return (row.ratio - row.avg10_ratio) / row.avg10_ratio * 100.0;
}

// -----------------------------------------------------------------------------
// passesConfirmation: stage 2 for one row
// -----------------------------------------------------------------------------
bool SignalScanner::passesConfirmation(const domain::SignalRow& row) {
  bool volume_expanding = row.volume > row.avg10_volume;
  bool bullish_bar = row.close > row.open;
  bool balance_holding = row.balance_shares > row.avg5_balance_threshold;
  return volume_expanding && bullish_bar && balance_holding;
}

// -----------------------------------------------------------------------------
// scan: rank by drop, cut to top_n, then confirm
// -----------------------------------------------------------------------------
std::vector<Candidate> SignalScanner::scan(
    const std::vector<domain::SignalRow>& rows) const {
  std::vector<Candidate> ranked;
  for (const auto& row : rows) {
    if (auto drop = dropPct(row)) {
      ranked.push_back(Candidate{row, *drop});
    }
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const Candidate& a, const Candidate& b) {
                     return a.drop_pct < b.drop_pct;
                   });

  if (ranked.size() > top_n_) {
    ranked.resize(top_n_);
  }

  std::vector<Candidate> confirmed;
  for (auto& candidate : ranked) {
    if (passesConfirmation(candidate.row)) {
      confirmed.push_back(std::move(candidate));
    }
  }
  return confirmed;
}

}  // namespace mrbt
