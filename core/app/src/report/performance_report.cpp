#include "mrbt/report/performance_report.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace mrbt {
namespace report {

namespace {

constexpr double kTradingDaysPerYear = 252.0;

double mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

}  // namespace

std::vector<double> dailyReturns(
    const std::vector<domain::PortfolioSnapshot>& snapshots) {
  std::vector<double> returns;
  for (std::size_t i = 1; i < snapshots.size(); ++i) {
    double prev = snapshots[i - 1].portfolio_value;
    if (prev <= 0.0) {
      continue;
    }
    returns.push_back((snapshots[i].portfolio_value - prev) / prev);
  }
  return returns;
}

std::optional<double> sharpeRatio(
    const std::vector<domain::PortfolioSnapshot>& snapshots) {
  std::vector<double> returns = dailyReturns(snapshots);
  if (returns.size() < 2) {
    return std::nullopt;
  }

  double mu = mean(returns);
  double sq_sum = 0.0;
  for (double r : returns) {
    sq_sum += (r - mu) * (r - mu);
  }
  double stdev = std::sqrt(sq_sum / static_cast<double>(returns.size() - 1));
  if (stdev <= 0.0) {
    return std::nullopt;
  }
  return mu / stdev * std::sqrt(kTradingDaysPerYear);
}

double maxDrawdown(const std::vector<domain::PortfolioSnapshot>& snapshots) {
  double running_max = 0.0;
  double worst = 0.0;
  for (const auto& snap : snapshots) {
    running_max = std::max(running_max, snap.portfolio_value);
    if (running_max <= 0.0) {
      continue;
    }
    double drawdown = (snap.portfolio_value - running_max) / running_max;
    worst = std::min(worst, drawdown);
  }
  return worst;
}

// -----------------------------------------------------------------------------
// summarize
// -----------------------------------------------------------------------------
PerformanceSummary summarize(
    double initial_capital, const std::vector<domain::Trade>& trades,
    const std::vector<domain::PortfolioSnapshot>& snapshots,
    double final_cash, std::vector<OpenPositionSummary> open_positions) {
  PerformanceSummary summary;
  summary.initial_capital = initial_capital;
  summary.final_cash = final_cash;
  summary.final_value = snapshots.empty() ? initial_capital
                                          : snapshots.back().portfolio_value;
  summary.total_return =
      initial_capital > 0.0
          ? (summary.final_value - initial_capital) / initial_capital
          : 0.0;
  summary.trading_days = snapshots.size();

  std::vector<double> pnl_pcts;
  std::vector<double> wins;
  std::vector<double> losses;
  std::map<std::string, std::vector<double>> reason_pcts;

  for (const auto& trade : trades) {
    if (trade.action == domain::TradeAction::Buy) {
      ++summary.buy_count;
      continue;
    }
    ++summary.sell_count;

    double pnl = trade.pnl.value_or(0.0);
    double pnl_pct = trade.pnl_pct.value_or(0.0);
    summary.total_pnl += pnl;
    pnl_pcts.push_back(pnl_pct);
    if (pnl > 0.0) {
      wins.push_back(pnl);
    } else {
      losses.push_back(pnl);
    }
    if (trade.reason) {
      reason_pcts[toString(*trade.reason)].push_back(pnl_pct);
    }
  }

  summary.winning_sells = wins.size();
  if (summary.sell_count > 0) {
    summary.win_rate = static_cast<double>(wins.size()) /
                       static_cast<double>(summary.sell_count);
  }
  summary.avg_pnl_pct = mean(pnl_pcts);
  summary.avg_win = mean(wins);
  summary.avg_loss = mean(losses);

  for (const auto& entry : reason_pcts) {
    summary.by_reason[entry.first] =
        ExitReasonStats{entry.second.size(), mean(entry.second)};
  }

  summary.sharpe_ratio = sharpeRatio(snapshots);
  summary.max_drawdown = maxDrawdown(snapshots);
  summary.open_positions = std::move(open_positions);
  return summary;
}

}  // namespace report
}  // namespace mrbt
