#include "mrbt/data/json_codec.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace mrbt {

namespace {

// Numeric field that may be absent or null upstream.
std::optional<double> optionalNumber(const nlohmann::json& record,
                                     const char* key) {
  auto it = record.find(key);
  if (it == record.end() || !it->is_number()) {
    return std::nullopt;
  }
  return it->get<double>();
}

domain::TradeDate decodeDate(const nlohmann::json& record) {
  const nlohmann::json& value = record.at("date");
  domain::TradeDate date = value.is_number_integer()
                               ? std::to_string(value.get<std::int64_t>())
                               : value.get<std::string>();
  if (!domain::isTradeDate(date)) {
    throw std::invalid_argument("malformed trade date: " + date);
  }
  return date;
}

}  // namespace

// -----------------------------------------------------------------------------
// decodeSignalRow
// -----------------------------------------------------------------------------
DecodedSignalRow decodeSignalRow(const nlohmann::json& record) {
  DecodedSignalRow decoded;
  domain::SignalRow& row = decoded.row;

  row.ticker = record.at("ticker").get<std::string>();
  row.date = decodeDate(record);
  auto name_it = record.find("stock_name");
  row.display_name = (name_it != record.end() && name_it->is_string())
                         ? name_it->get<std::string>()
                         : row.ticker;

  // Each analytic field is optional; any gap marks the row incomplete.
  struct Field {
    const char* key;
    double* target;
  };
  const Field fields[] = {
      {"margin_ratio", &row.ratio},
      {"avg_10day_ratio", &row.avg10_ratio},
      {"volume", &row.volume},
      {"avg_10day_volume", &row.avg10_volume},
      {"open_price", &row.open},
      {"close_price", &row.close},
      {"margin_balance_shares", &row.balance_shares},
      {"avg_5day_balance_95", &row.avg5_balance_threshold},
  };

  for (const auto& field : fields) {
    if (auto value = optionalNumber(record, field.key)) {
      *field.target = *value;
    } else {
      decoded.complete = false;
    }
  }
  return decoded;
}

// -----------------------------------------------------------------------------
// decodePriceBar
// -----------------------------------------------------------------------------
domain::PriceBar decodePriceBar(const nlohmann::json& record) {
  domain::PriceBar bar;
  bar.ticker = record.at("ticker").get<std::string>();
  bar.date = decodeDate(record);
  bar.open = optionalNumber(record, "open").value_or(0.0);
  bar.high = optionalNumber(record, "high").value_or(0.0);
  bar.low = optionalNumber(record, "low").value_or(0.0);
  bar.close = optionalNumber(record, "close").value_or(0.0);
  return bar;
}

// -----------------------------------------------------------------------------
// loadMarketData: snapshot document → store
// -----------------------------------------------------------------------------
std::size_t loadMarketData(const nlohmann::json& document,
                           MarketDataStore& store) {
  std::size_t loaded = 0;

  if (auto it = document.find("signals"); it != document.end()) {
    for (const auto& record : *it) {
      DecodedSignalRow decoded = decodeSignalRow(record);
      store.addSignalRow(std::move(decoded.row), decoded.complete);
      ++loaded;
    }
  }

  if (auto it = document.find("bars"); it != document.end()) {
    for (const auto& record : *it) {
      store.addBar(decodePriceBar(record));
      ++loaded;
    }
  }

  return loaded;
}

std::size_t loadMarketDataFile(const std::string& path,
                               MarketDataStore& store) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open market data file: " + path);
  }
  nlohmann::json document = nlohmann::json::parse(file);
  return loadMarketData(document, store);
}

}  // namespace mrbt
