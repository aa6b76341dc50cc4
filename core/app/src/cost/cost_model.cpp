#include "mrbt/cost/cost_model.hpp"

#include <algorithm>

namespace mrbt {
namespace cost {

double commission(double value, bool is_odd_lot,
                  const domain::CostSchedule& schedule) {
  double floor_amount = is_odd_lot ? schedule.min_commission_odd_lot
                                   : schedule.min_commission_round_lot;
  return std::max(value * schedule.commission_rate, floor_amount);
}

double transactionTax(double value, bool is_same_day_trade,
                      const domain::CostSchedule& schedule) {
  double rate =
      is_same_day_trade ? schedule.day_trade_tax_rate : schedule.tax_rate;
  return value * rate;
}

}  // namespace cost
}  // namespace mrbt
