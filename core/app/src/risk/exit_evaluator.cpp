#include "mrbt/risk/exit_evaluator.hpp"

#include <string>
#include <vector>

namespace mrbt {

namespace {

struct PendingExit {
  std::string ticker;
  double price;
  domain::ExitReason reason;
};

}  // namespace

ExitEvaluator::ExitEvaluator(const domain::StrategyParams& params,
                             const ITradingCalendar& calendar,
                             const IPriceRepository& prices,
                             const OrderExecutor& executor)
    : params_(params),
      calendar_(calendar),
      prices_(prices),
      executor_(executor) {}

// -----------------------------------------------------------------------------
// evaluate: take-profit → stop-loss → holding period
// -----------------------------------------------------------------------------
std::optional<domain::ExitReason> ExitEvaluator::evaluate(
    const domain::Position& position, double close,
    const domain::TradeDate& date) const {
  if (position.weighted_cost > 0.0) {
    double ret = (close - position.weighted_cost) / position.weighted_cost;

    if (params_.enable_take_profit && ret >= params_.take_profit) {
      return domain::ExitReason::TakeProfit;
    }
    if (params_.enable_stop_loss && ret <= -params_.stop_loss) {
      return domain::ExitReason::StopLoss;
    }
  }

  int held = calendar_.elapsedTradingDays(position.entry_date, date);
  if (held >= params_.holding_period) {
    return domain::ExitReason::HoldingPeriod;
  }
  return std::nullopt;
}

StepResult ExitEvaluator::apply(EngineState state,
                                const domain::TradeDate& date) const {
  std::vector<PendingExit> exits;
  for (const auto& entry : state.ledger.positions()) {
    const domain::Position& position = entry.second;
    auto close = prices_.close(position.ticker, date);
    if (!close) {
      continue;
    }
    if (auto reason = evaluate(position, *close, date)) {
      exits.push_back(PendingExit{position.ticker, *close, *reason});
    }
  }

  StepResult acc;
  acc.state = std::move(state);
  for (const auto& exit : exits) {
    chain(acc, executor_.sell(std::move(acc.state), exit.ticker, exit.price,
                              date, exit.reason));
  }
  return acc;
}

}  // namespace mrbt
