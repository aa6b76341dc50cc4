#pragma once

#include "mrbt/domain/portfolio_snapshot.hpp"
#include "mrbt/domain/trade.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// OpenPositionSummary: a position still held when the run ends
// -----------------------------------------------------------------------------
// last_close is the most recent close at or before the end of the run;
// market_value is 0 when no close was ever seen.
// -----------------------------------------------------------------------------
struct OpenPositionSummary {
  std::string ticker;
  std::string display_name;
  std::int64_t shares{0};
  double weighted_cost{0.0};
  domain::TradeDate entry_date;
  std::optional<double> last_close;
  double market_value{0.0};
};

struct ExitReasonStats {
  std::size_t count{0};
  double avg_pnl_pct{0.0};
};

// -----------------------------------------------------------------------------
// PerformanceSummary
// -----------------------------------------------------------------------------
// All returns and drawdowns are fractions (0.05 == 5%). pnl_pct values are
// percentages, as on the Trade records.
// -----------------------------------------------------------------------------
struct PerformanceSummary {
  double initial_capital{0.0};
  double final_cash{0.0};
  double final_value{0.0};
  double total_return{0.0};
  std::size_t trading_days{0};

  std::size_t buy_count{0};
  std::size_t sell_count{0};
  std::size_t winning_sells{0};
  double win_rate{0.0};
  double total_pnl{0.0};
  double avg_pnl_pct{0.0};
  double avg_win{0.0};
  double avg_loss{0.0};

  // Keyed by toString(ExitReason).
  std::map<std::string, ExitReasonStats> by_reason;

  std::optional<double> sharpe_ratio;
  double max_drawdown{0.0};

  std::vector<OpenPositionSummary> open_positions;
};

namespace report {

// Day-over-day fractional changes in portfolio value.
std::vector<double> dailyReturns(
    const std::vector<domain::PortfolioSnapshot>& snapshots);

// -------------------------------------------------------------------------
// sharpeRatio(snapshots)
// -------------------------------------------------------------------------
// @brief  mean(r) / stdev(r) × √252 over dailyReturns(), using the sample
//         standard deviation.
//
// @return std::nullopt when fewer than two returns exist or the standard
//         deviation is zero.
// -------------------------------------------------------------------------
std::optional<double> sharpeRatio(
    const std::vector<domain::PortfolioSnapshot>& snapshots);

// min over snapshots of (value - running_max) / running_max. 0 for an
// empty or monotonically rising series.
double maxDrawdown(const std::vector<domain::PortfolioSnapshot>& snapshots);

// -------------------------------------------------------------------------
// summarize(...)
// -------------------------------------------------------------------------
// @brief  Builds the full PerformanceSummary for one run.
//
// @details
// final_value is the last snapshot's portfolio value, or initial_capital
// when the run produced no snapshots.
// -------------------------------------------------------------------------
PerformanceSummary summarize(
    double initial_capital, const std::vector<domain::Trade>& trades,
    const std::vector<domain::PortfolioSnapshot>& snapshots,
    double final_cash, std::vector<OpenPositionSummary> open_positions);

}  // namespace report
}  // namespace mrbt
