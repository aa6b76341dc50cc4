#include "mrbt/state/engine_state.hpp"

namespace mrbt {

const char* toString(RejectReason reason) {
  switch (reason) {
    case RejectReason::NoShares:
      return "no_shares";
    case RejectReason::InsufficientCash:
      return "insufficient_cash";
    case RejectReason::MissingOpenPrice:
      return "missing_open_price";
    case RejectReason::HoldingWindowElapsed:
      return "holding_window_elapsed";
    case RejectReason::LimitNotReached:
      return "limit_not_reached";
    case RejectReason::MissingPriceBar:
      return "missing_price_bar";
  }
  return "unknown";
}

}  // namespace mrbt
