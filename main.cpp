// -----------------------------------------------------------------------------
// mrbt_backtest: margin-ratio backtest entry point.
//
//   1) Build the BacktestConfig from defaults, an optional JSON file and the
//      command-line flags, then validate it.
//   2) Load market data into a MarketDataStore, either from a JSON snapshot
//      file (--data) or from the upstream ZeroMQ publisher (--zmq).
//   3) Derive the trading calendar from the distinct signal dates.
//   4) Subscribe logging callbacks on the engine's EventBus.
//   5) Run the backtest, print the summary, and write the optional trade
//      ledger CSV and JSON summary.
//
// Any configuration or I/O error is reported on std::cerr and the process
// exits with status 1.
// -----------------------------------------------------------------------------

#include "mrbt/calendar/trading_calendar.hpp"
#include "mrbt/config/backtest_config.hpp"
#include "mrbt/data/json_codec.hpp"
#include "mrbt/data/market_data_store.hpp"
#include "mrbt/engine/backtest_engine.hpp"
#include "mrbt/events/event.hpp"
#include "mrbt/gateway/market_data_gateway.hpp"
#include "mrbt/report/performance_report.hpp"
#include "mrbt/report/report_writer.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// -----------------------------------------------------------------------------
// Only set while the gateway is receiving, so SIGINT can end the load early.
// -----------------------------------------------------------------------------
static mrbt::MarketDataGateway* g_gateway_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

static void loadMarketData(const mrbt::BacktestConfig& config,
                           mrbt::MarketDataStore& store) {
  if (!config.data_path.empty()) {
    std::size_t loaded = mrbt::loadMarketDataFile(config.data_path, store);
    std::cout << "[main] loaded " << loaded << " records from "
              << config.data_path << "\n";
    return;
  }

  mrbt::MarketDataGateway gateway(store, config.zmq_endpoint);
  g_gateway_ptr = &gateway;
  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] MarketDataGateway receiving from "
            << config.zmq_endpoint << " (Ctrl-C to stop)\n";
  std::size_t loaded = gateway.run();

  std::signal(SIGINT, SIG_DFL);
  g_gateway_ptr = nullptr;

  std::cout << "[main] gateway loaded " << loaded << " records ("
            << gateway.signalsLoaded() << " signal rows, "
            << gateway.barsLoaded() << " bars, " << gateway.malformedCount()
            << " malformed)\n";
}

static void subscribeLogging(mrbt::EventBus& bus) {
  bus.onTrade([](const mrbt::TradeEvent& e) {
    const mrbt::domain::Trade& t = e.trade;
    std::cout << "[Trade] " << t.date << " " << mrbt::domain::toString(t.action)
              << " " << t.ticker << " " << t.display_name
              << " shares=" << t.shares << " price=" << t.price
              << " net=" << t.net_amount;
    if (t.reason) {
      std::cout << " reason=" << mrbt::domain::toString(*t.reason)
                << " pnl=" << t.pnl.value_or(0.0) << " ("
                << t.pnl_pct.value_or(0.0) << "%)";
    }
    std::cout << "\n";
  });

  bus.onReject([](const mrbt::OrderRejectEvent& e) {
    std::cout << "[OrderReject] " << e.rejection.date << " "
              << e.rejection.ticker << " "
              << mrbt::toString(e.rejection.reason) << "\n";
  });
}

int main(int argc, char** argv) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    mrbt::BacktestConfig config = mrbt::parseCommandLine(args);
    if (config.show_help) {
      std::cout << mrbt::usage(argv[0]);
      return 0;
    }
    mrbt::validate(config);

    mrbt::MarketDataStore store;
    loadMarketData(config, store);

    mrbt::TradingCalendar calendar(store.signalDates());
    std::cout << "[main] calendar: " << calendar.size()
              << " trading dates, " << store.signalRowCount()
              << " signal rows, " << store.barCount() << " bars\n";

    mrbt::BacktestEngine engine(calendar, store, store);
    subscribeLogging(engine.eventBus());

    mrbt::BacktestResult result = engine.run(config);

    mrbt::PerformanceSummary summary = mrbt::report::summarize(
        result.initial_capital, result.trades, result.snapshots,
        result.final_cash, result.open_positions);
    mrbt::report::printSummary(std::cout, summary);

    if (!config.trades_out.empty()) {
      mrbt::report::writeTradeLedgerCsv(config.trades_out, result.trades);
      std::cout << "[main] trade ledger written to " << config.trades_out
                << "\n";
    }
    if (!config.report_out.empty()) {
      mrbt::report::writeSummaryJson(config.report_out, summary);
      std::cout << "[main] summary written to " << config.report_out << "\n";
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "[main] invalid configuration: " << e.what() << "\n"
              << mrbt::usage(argc > 0 ? argv[0] : "mrbt_backtest");
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
