#include "mrbt/eventbus/event_bus.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace mrbt {

namespace {

// A handler may register another one mid-dispatch and reallocate the
// vector, so each handler is invoked through a copy.
template <typename Handler, typename Payload>
void dispatch(const std::vector<Handler>& handlers, const Payload& payload) {
  for (std::size_t i = 0; i < handlers.size(); ++i) {
    Handler handler = handlers[i];
    handler(payload);
  }
}

}  // namespace

std::uint64_t sequenceOf(const Event& event) {
  return std::visit([](const auto& e) { return e.sequence_id; }, event);
}

void EventBus::onTrade(TradeHandler handler) {
  trade_handlers_.push_back(std::move(handler));
}

void EventBus::onReject(RejectHandler handler) {
  reject_handlers_.push_back(std::move(handler));
}

void EventBus::onSnapshot(SnapshotHandler handler) {
  snapshot_handlers_.push_back(std::move(handler));
}

void EventBus::onAny(AnyHandler handler) {
  any_handlers_.push_back(std::move(handler));
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::uint64_t sequence = sequenceOf(event);
  if (sequence <= last_sequence_) {
    throw std::logic_error("event sequence " + std::to_string(sequence) +
                           " does not follow " +
                           std::to_string(last_sequence_));
  }
  last_sequence_ = sequence;

  std::visit(
      [this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TradeEvent>) {
          dispatch(trade_handlers_, e);
        } else if constexpr (std::is_same_v<T, OrderRejectEvent>) {
          dispatch(reject_handlers_, e);
        } else {
          dispatch(snapshot_handlers_, e);
        }
      },
      event);

  dispatch(any_handlers_, event);
}

std::size_t EventBus::handlerCount() const {
  return trade_handlers_.size() + reject_handlers_.size() +
         snapshot_handlers_.size() + any_handlers_.size();
}

}  // namespace mrbt
