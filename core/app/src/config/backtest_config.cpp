#include "mrbt/config/backtest_config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mrbt {

namespace {

domain::EntryMode entryModeOrThrow(const std::string& text) {
  auto mode = domain::parseEntryMode(text);
  if (!mode) {
    throw std::invalid_argument("unknown entry mode '" + text +
                                "' (expected market or limit)");
  }
  return *mode;
}

double capitalOrThrow(const std::string& text) {
  std::size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &consumed);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("invalid --capital value: " + text);
  }
  if (consumed != text.size()) {
    throw std::invalid_argument("invalid --capital value: " + text);
  }
  return value;
}

}  // namespace

// -----------------------------------------------------------------------------
// applyJson
// -----------------------------------------------------------------------------
void applyJson(BacktestConfig& config, const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::invalid_argument("config document must be a JSON object");
  }

  if (document.contains("start_date")) {
    config.start_date = document.at("start_date").get<std::string>();
  }
  if (document.contains("end_date")) {
    config.end_date = document.at("end_date").get<std::string>();
  }
  if (document.contains("initial_capital")) {
    config.initial_capital = document.at("initial_capital").get<double>();
  }
  if (document.contains("enable_take_profit")) {
    config.enable_take_profit = document.at("enable_take_profit").get<bool>();
  }
  if (document.contains("enable_stop_loss")) {
    config.enable_stop_loss = document.at("enable_stop_loss").get<bool>();
  }
  if (document.contains("entry_mode")) {
    config.entry_mode =
        entryModeOrThrow(document.at("entry_mode").get<std::string>());
  }
  if (document.contains("data_path")) {
    config.data_path = document.at("data_path").get<std::string>();
  }
  if (document.contains("zmq_endpoint")) {
    config.zmq_endpoint = document.at("zmq_endpoint").get<std::string>();
  }
  if (document.contains("trades_out")) {
    config.trades_out = document.at("trades_out").get<std::string>();
  }
  if (document.contains("report_out")) {
    config.report_out = document.at("report_out").get<std::string>();
  }
}

void applyConfigFile(BacktestConfig& config, const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open config file: " + path);
  }
  applyJson(config, nlohmann::json::parse(file));
}

// -----------------------------------------------------------------------------
// parseCommandLine
// -----------------------------------------------------------------------------
BacktestConfig parseCommandLine(const std::vector<std::string>& args) {
  BacktestConfig config;

  auto valueAt = [&args](std::size_t i) -> const std::string& {
    if (i + 1 >= args.size()) {
      throw std::invalid_argument("missing value for " + args[i]);
    }
    return args[i + 1];
  };

  // The config file is the base layer, whatever its position.
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config") {
      applyConfigFile(config, valueAt(i));
      ++i;
    }
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& flag = args[i];

    if (flag == "--config") {
      ++i;
    } else if (flag == "--data") {
      config.data_path = valueAt(i);
      ++i;
    } else if (flag == "--zmq") {
      config.zmq_endpoint = valueAt(i);
      ++i;
    } else if (flag == "--start") {
      config.start_date = valueAt(i);
      ++i;
    } else if (flag == "--end") {
      config.end_date = valueAt(i);
      ++i;
    } else if (flag == "--capital") {
      config.initial_capital = capitalOrThrow(valueAt(i));
      ++i;
    } else if (flag == "--entry-mode") {
      config.entry_mode = entryModeOrThrow(valueAt(i));
      ++i;
    } else if (flag == "--trades-out") {
      config.trades_out = valueAt(i);
      ++i;
    } else if (flag == "--report-out") {
      config.report_out = valueAt(i);
      ++i;
    } else if (flag == "--no-take-profit") {
      config.enable_take_profit = false;
    } else if (flag == "--no-stop-loss") {
      config.enable_stop_loss = false;
    } else if (flag == "--help" || flag == "-h") {
      config.show_help = true;
    } else {
      throw std::invalid_argument("unknown argument: " + flag);
    }
  }
  return config;
}

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
void validate(const BacktestConfig& config) {
  if (!domain::isTradeDate(config.start_date)) {
    throw std::invalid_argument("start date must be YYYYMMDD, got '" +
                                config.start_date + "'");
  }
  if (!domain::isTradeDate(config.end_date)) {
    throw std::invalid_argument("end date must be YYYYMMDD, got '" +
                                config.end_date + "'");
  }
  if (config.start_date > config.end_date) {
    throw std::invalid_argument("start date " + config.start_date +
                                " is after end date " + config.end_date);
  }
  if (!(config.initial_capital > 0.0)) {
    throw std::invalid_argument("initial capital must be positive");
  }
  if (config.data_path.empty() && config.zmq_endpoint.empty()) {
    throw std::invalid_argument(
        "no market data source: pass --data <file> or --zmq <endpoint>");
  }
}

std::string usage(const std::string& program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options]\n"
      << "  --config <file>          JSON config file (applied first)\n"
      << "  --data <file>            market data snapshot JSON\n"
      << "  --zmq <endpoint>         receive market data from a ZMQ publisher\n"
      << "  --start <YYYYMMDD>       first trading date (default 20200101)\n"
      << "  --end <YYYYMMDD>         last trading date (default 20251117)\n"
      << "  --capital <amount>       initial capital (default 1000000)\n"
      << "  --entry-mode <mode>      market | limit (default market)\n"
      << "  --no-take-profit         disable the take-profit rule\n"
      << "  --no-stop-loss           disable stop orders and the close check\n"
      << "  --trades-out <file>      write the trade ledger as CSV\n"
      << "  --report-out <file>      write the performance summary as JSON\n"
      << "  --help                   show this text\n";
  return out.str();
}

}  // namespace mrbt
