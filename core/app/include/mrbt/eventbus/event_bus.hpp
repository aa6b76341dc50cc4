#pragma once

#include "mrbt/events/event.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Fans the engine's per-day output out to observers (console
// logging, tests). BacktestEngine publishes trades, rejections and the daily
// snapshot; it never calls an observer directly.
//
// Ordering:
//   Every event carries a sequence_id. publish() accepts only ids strictly
//   greater than the last one delivered, so observers see a run's events in
//   exactly the order the engine produced them. beginRun() rewinds the
//   counter for the next run.
//
// Thread model:
//   Single-threaded. Handlers run synchronously inside publish(), on the
//   thread driving BacktestEngine::run(). Not safe for concurrent use.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using AnyHandler = std::function<void(const Event&)>;
  using TradeHandler = std::function<void(const TradeEvent&)>;
  using RejectHandler = std::function<void(const OrderRejectEvent&)>;
  using SnapshotHandler = std::function<void(const PortfolioSnapshotEvent&)>;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Handlers for one kind run before the catch-all handlers, each group in
  // registration order.
  void onTrade(TradeHandler handler);
  void onReject(RejectHandler handler);
  void onSnapshot(SnapshotHandler handler);
  void onAny(AnyHandler handler);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // @brief  Delivers the event to its kind's handlers, then to onAny ones.
  //
  // @throws std::logic_error if event's sequence_id is not greater than
  //         lastSequence(). Nothing is delivered in that case.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  // Forgets the last delivered sequence_id; handlers stay registered.
  void beginRun() { last_sequence_ = 0; }

  std::uint64_t lastSequence() const { return last_sequence_; }
  std::size_t handlerCount() const;

 private:
  std::vector<TradeHandler> trade_handlers_;
  std::vector<RejectHandler> reject_handlers_;
  std::vector<SnapshotHandler> snapshot_handlers_;
  std::vector<AnyHandler> any_handlers_;
  std::uint64_t last_sequence_{0};
};

// sequence_id of whichever alternative the event holds.
std::uint64_t sequenceOf(const Event& event);

}  // namespace mrbt
