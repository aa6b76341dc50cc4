#pragma once

#include "mrbt/data/market_data_store.hpp"
#include "mrbt/domain/signal_row.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace mrbt {

// -----------------------------------------------------------------------------
// JSON codec for upstream market data
// -----------------------------------------------------------------------------
//
// @brief  Decodes the JSON records emitted by the upstream signal pipeline
//         and price collector, shared by the snapshot-file loader and the
//         ZeroMQ gateway.
//
// @details
// Signal record (column names follow the upstream strategy table):
//   {
//     "ticker": "2330", "stock_name": "TSMC", "date": "20240102",
//     "margin_ratio": 165.2,          "avg_10day_ratio": 171.8,
//     "volume": 25000000,             "avg_10day_volume": 21000000,
//     "open_price": 590.0,            "close_price": 596.0,
//     "margin_balance_shares": 31000, "avg_5day_balance_95": 29000
//   }
//   Analytic fields may be null or absent; such rows decode with
//   complete = false and the missing values set to 0.
//
// Price bar record:
//   { "ticker": "2330", "date": "20240102",
//     "open": 590.0, "high": 600.0, "low": 588.0, "close": 596.0 }
//
// "date" may be a string or an integer (20240102). "ticker" and "date" are
// mandatory: a missing key throws nlohmann::json::out_of_range and a
// malformed date throws std::invalid_argument.
// -----------------------------------------------------------------------------

struct DecodedSignalRow {
  domain::SignalRow row;
  bool complete{true};
};

DecodedSignalRow decodeSignalRow(const nlohmann::json& record);

domain::PriceBar decodePriceBar(const nlohmann::json& record);

// -------------------------------------------------------------------------
// loadMarketData(document, store)
// -------------------------------------------------------------------------
// @brief  Loads a snapshot document { "signals": [...], "bars": [...] }
//         into the store. Either array may be absent.
//
// @return Number of records loaded (signals + bars).
// -------------------------------------------------------------------------
std::size_t loadMarketData(const nlohmann::json& document,
                           MarketDataStore& store);

// -------------------------------------------------------------------------
// loadMarketDataFile(path, store)
// -------------------------------------------------------------------------
// @brief  Reads and parses a snapshot file, then calls loadMarketData().
//
// @details
// Throws std::runtime_error if the file cannot be opened and
// nlohmann::json::parse_error if it is not valid JSON.
// -------------------------------------------------------------------------
std::size_t loadMarketDataFile(const std::string& path,
                               MarketDataStore& store);

}  // namespace mrbt
