#pragma once

#include "event_types.hpp"
#include <variant>

namespace mrbt {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by the EventBus. Dispatch with
// std::visit or std::get_if; adding a new event kind means adding it here.
// -----------------------------------------------------------------------------
using Event = std::variant<
    TradeEvent,
    OrderRejectEvent,
    PortfolioSnapshotEvent>;

}  // namespace mrbt
