#pragma once

#include "mrbt/data/i_price_repository.hpp"
#include "mrbt/data/i_signal_repository.hpp"

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// MarketDataStore: in-memory signal and price tables
// -----------------------------------------------------------------------------
//
// @brief  Implements both ISignalRepository and IPriceRepository over two
//         in-memory tables that are filled before a run, either from a JSON
//         snapshot file (loadMarketDataFile) or from the ZeroMQ feeder
//         (MarketDataGateway).
//
// @details
// Signal table:
//   Rows are grouped by date and kept in insertion order within a date, so
//   the scanner sees them in the order the upstream pipeline emitted them.
//   Adding a row for an existing (ticker, date) replaces it.
//   Each row carries a `complete` flag. Incomplete rows (some analytic field
//   missing upstream) are still served by signalRow() for price lookups but
//   are filtered out of signalsOn().
//
// Price table:
//   One PriceBar per (ticker, date).
//
// close() resolution:
//   1. The bar's close, if a bar exists and its close is positive.
//   2. Otherwise the signal row's close, if positive.
//   3. Otherwise std::nullopt (data gap).
//   Zero or negative prices are treated as missing, matching how the
//   upstream tables encode absent quotes.
//
// Thread model:
//   Not synchronized. Populate from one thread, then share read-only.
// -----------------------------------------------------------------------------
class MarketDataStore final : public ISignalRepository,
                              public IPriceRepository {
 public:
  MarketDataStore() = default;

  // -------------------------------------------------------------------------
  // addSignalRow(row, complete)
  // -------------------------------------------------------------------------
  // @brief  Inserts or replaces the row for (row.ticker, row.date).
  //
  // @param  complete  False when any analytic field was missing upstream.
  // -------------------------------------------------------------------------
  void addSignalRow(domain::SignalRow row, bool complete = true);

  // Inserts or replaces the bar for (bar.ticker, bar.date).
  void addBar(domain::PriceBar bar);

  // --- ISignalRepository ----------------------------------------------------
  std::vector<domain::SignalRow> signalsOn(
      const domain::TradeDate& date) const override;

  std::optional<domain::SignalRow> signalRow(
      const std::string& ticker,
      const domain::TradeDate& date) const override;

  // --- IPriceRepository -----------------------------------------------------
  std::optional<domain::PriceBar> bar(
      const std::string& ticker,
      const domain::TradeDate& date) const override;

  std::optional<double> close(const std::string& ticker,
                              const domain::TradeDate& date) const override;

  // Distinct dates present in the signal table, ascending. This is the
  // trading calendar for a backtest over this store.
  std::vector<domain::TradeDate> signalDates() const;

  std::size_t signalRowCount() const;
  std::size_t barCount() const { return bars_.size(); }

 private:
  struct StoredRow {
    domain::SignalRow row;
    bool complete{true};
  };

  const StoredRow* findRow(const std::string& ticker,
                           const domain::TradeDate& date) const;

  std::map<domain::TradeDate, std::vector<StoredRow>> rows_by_date_;
  std::map<std::pair<std::string, domain::TradeDate>, domain::PriceBar> bars_;
};

}  // namespace mrbt
