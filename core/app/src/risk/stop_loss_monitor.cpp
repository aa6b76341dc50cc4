#include "mrbt/risk/stop_loss_monitor.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mrbt {

StopLossMonitor::StopLossMonitor(const IPriceRepository& prices,
                                 const OrderExecutor& executor)
    : prices_(prices), executor_(executor) {}

bool StopLossMonitor::isTriggered(const domain::StopLossOrder& order,
                                  const domain::PriceBar& bar) {
  return bar.low > 0.0 && bar.low <= order.trigger_price;
}

StepResult StopLossMonitor::check(EngineState state,
                                  const domain::TradeDate& date) const {
  // Collect first: sell() removes entries from the stop order map.
  std::vector<std::pair<std::string, double>> triggered;
  for (const auto& entry : state.ledger.stopOrders()) {
    const domain::StopLossOrder& order = entry.second;
    auto bar = prices_.bar(order.ticker, date);
    if (bar && isTriggered(order, *bar)) {
      triggered.emplace_back(order.ticker, order.trigger_price);
    }
  }

  StepResult acc;
  acc.state = std::move(state);
  for (const auto& hit : triggered) {
    chain(acc, executor_.sell(std::move(acc.state), hit.first, hit.second,
                              date, domain::ExitReason::StopLoss));
  }
  return acc;
}

}  // namespace mrbt
