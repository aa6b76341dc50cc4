#pragma once

#include "mrbt/domain/trade.hpp"
#include "mrbt/domain/trade_date.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// BacktestConfig: one run's settings
// -----------------------------------------------------------------------------
//
// @brief  Window, capital, rule toggles, entry mode and I/O locations.
//
// @details
// Built in three layers, later layers winning:
//   1. the defaults below
//   2. a JSON file (--config path, keys named as the members)
//   3. command-line flags
//
// Strategy constants (sizing, thresholds, costs) are not configurable here;
// they live in domain::StrategyParams.
//
// Market data comes from exactly one source: data_path (a JSON snapshot
// file) or zmq_endpoint (the MarketDataGateway). validate() rejects a
// config with neither.
// -----------------------------------------------------------------------------
struct BacktestConfig {
  domain::TradeDate start_date{"20200101"};
  domain::TradeDate end_date{"20251117"};
  double initial_capital{1'000'000.0};
  bool enable_take_profit{true};
  bool enable_stop_loss{true};
  domain::EntryMode entry_mode{domain::EntryMode::MarketAtOpen};

  std::string data_path;
  std::string zmq_endpoint;
  std::string trades_out;   // empty: no CSV
  std::string report_out;   // empty: no JSON summary

  bool show_help{false};
};

// Overlays the keys present in `document` onto `config`. Throws
// std::invalid_argument for an unknown entry_mode and nlohmann exceptions
// for wrongly typed values.
void applyJson(BacktestConfig& config, const nlohmann::json& document);

// Reads and applies a JSON config file. Throws std::runtime_error if the
// file cannot be opened.
void applyConfigFile(BacktestConfig& config, const std::string& path);

// -----------------------------------------------------------------------------
// parseCommandLine(args)
// -----------------------------------------------------------------------------
// @brief  Builds a config from the program arguments (argv[0] excluded).
//
// @details
// --config is applied first wherever it appears, then every other flag in
// order. Unknown flags and flags missing their value throw
// std::invalid_argument. The result is not validated; call validate().
// -----------------------------------------------------------------------------
BacktestConfig parseCommandLine(const std::vector<std::string>& args);

// Throws std::invalid_argument when a setting is out of range.
void validate(const BacktestConfig& config);

// Usage text for --help and argument errors.
std::string usage(const std::string& program);

}  // namespace mrbt
