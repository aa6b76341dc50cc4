#include "mrbt/gateway/market_data_gateway.hpp"
#include "mrbt/data/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

namespace mrbt {

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(MarketDataStore& store,
                                     const std::string& endpoint,
                                     std::size_t max_idle_cycles)
    : store_(store), max_idle_cycles_(max_idle_cycles) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a timeout recv() would block forever and neither stop() nor
  // the idle limit could take effect.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): receive until eos, stop() or the idle limit
// -----------------------------------------------------------------------------
std::size_t MarketDataGateway::run() {
  running_.store(true);
  std::size_t loaded = 0;
  std::size_t idle_cycles = 0;

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);

    if (!result.has_value()) {
      ++idle_cycles;
      if (max_idle_cycles_ > 0 && idle_cycles >= max_idle_cycles_) {
        std::cerr << "[MarketDataGateway] no data for " << idle_cycles
                  << " receive timeouts, giving up\n";
        break;
      }
      continue;
    }
    idle_cycles = 0;

    MessageKind kind = handleMessage(msg.to_string());
    if (kind == MessageKind::Signal || kind == MessageKind::Bar) {
      ++loaded;
    } else if (kind == MessageKind::EndOfStream) {
      std::cout << "[MarketDataGateway] end of stream after " << loaded
                << " records\n";
      break;
    }
  }

  running_.store(false);
  return loaded;
}

void MarketDataGateway::stop() {
  running_.store(false);
}

// -----------------------------------------------------------------------------
// handleMessage(): decode one tagged JSON message into the store
// -----------------------------------------------------------------------------
MarketDataGateway::MessageKind MarketDataGateway::handleMessage(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);
    std::string type = json.at("type").get<std::string>();

    if (type == "signal") {
      DecodedSignalRow decoded = decodeSignalRow(json);
      store_.addSignalRow(std::move(decoded.row), decoded.complete);
      ++signals_loaded_;
      return MessageKind::Signal;
    }
    if (type == "bar") {
      store_.addBar(decodePriceBar(json));
      ++bars_loaded_;
      return MessageKind::Bar;
    }
    if (type == "eos") {
      return MessageKind::EndOfStream;
    }

    std::cerr << "[MarketDataGateway] unknown message type '" << type
              << "', payload: " << payload << "\n";
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON error: " << e.what()
              << ", payload: " << payload << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[MarketDataGateway] bad field: " << e.what()
              << ", payload: " << payload << "\n";
  }

  ++malformed_;
  return MessageKind::Malformed;
}

}  // namespace mrbt
