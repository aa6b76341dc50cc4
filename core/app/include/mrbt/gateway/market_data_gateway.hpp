#pragma once

#include "mrbt/data/market_data_store.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <string>

namespace mrbt {

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ bridge from the upstream data pipeline
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded signal rows and
//         price bars and loads them into a MarketDataStore before a run.
//
// @details
// The upstream pipeline computes the margin-ratio analytics per ticker and
// date and publishes them over ZeroMQ PUB. Each message is one JSON object
// tagged with "type":
//
//   {"type": "signal", "ticker": "2330", "date": "20240102",
//    "stock_name": "...", "margin_ratio": 12.5, "avg_10day_ratio": 15.0,
//    "volume": 3000000, "avg_10day_volume": 2000000,
//    "open_price": 50.0, "close_price": 51.0,
//    "margin_balance_shares": 12000, "avg_5day_balance_95": 10000}
//
//   {"type": "bar", "ticker": "2330", "date": "20240102",
//    "open": 50.0, "high": 52.0, "low": 49.5, "close": 51.0}
//
//   {"type": "eos"}                      end of stream, run() returns
//
// Field decoding is shared with the snapshot file loader (json_codec).
// Malformed messages are logged to std::cerr and skipped; they never abort
// the load.
//
// run() returns when it sees "eos", when stop() is called, or when
// max_idle_cycles consecutive receive timeouts pass with no message
// (0 disables the idle limit).
//
// Thread model:
//   run() blocks the calling thread; main() calls it before the backtest
//   starts, so the store is fully loaded before the engine reads it.
//   stop() may be called from any thread (e.g. the SIGINT handler).
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t. Holds a reference to the
//   MarketDataStore, which must outlive the gateway.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  enum class MessageKind {
    Signal,
    Bar,
    EndOfStream,
    Malformed,
  };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Creates the SUB socket, subscribes to everything, sets the
  //         receive timeout and connects to `endpoint`.
  //
  // @param  store            Destination for decoded rows and bars.
  // @param  endpoint         ZMQ endpoint of the publisher.
  // @param  max_idle_cycles  Consecutive empty receive timeouts before run()
  //                          gives up. 0 waits until eos or stop().
  // -------------------------------------------------------------------------
  explicit MarketDataGateway(MarketDataStore& store,
                             const std::string& endpoint =
                                 "tcp://127.0.0.1:5555",
                             std::size_t max_idle_cycles = 50);

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  // @brief  Blocking receive loop.
  //
  // @return Number of signal rows and bars loaded during this call.
  // -------------------------------------------------------------------------
  std::size_t run();

  // Requests run() to return within one receive timeout.
  void stop();

  // -------------------------------------------------------------------------
  // handleMessage(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one raw message and applies it to the store.
  //
  // @details
  // Called by run() for every received message; exposed so decoding can be
  // exercised without a live publisher. JSON and field errors are caught
  // here, logged, and reported as MessageKind::Malformed.
  // -------------------------------------------------------------------------
  MessageKind handleMessage(const std::string& payload);

  std::size_t signalsLoaded() const { return signals_loaded_; }
  std::size_t barsLoaded() const { return bars_loaded_; }
  std::size_t malformedCount() const { return malformed_; }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  MarketDataStore& store_;
  const std::size_t max_idle_cycles_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};

  std::size_t signals_loaded_{0};
  std::size_t bars_loaded_{0};
  std::size_t malformed_{0};
};

}  // namespace mrbt
