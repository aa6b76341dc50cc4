#include "mrbt/data/market_data_store.hpp"

#include <algorithm>

namespace mrbt {

// -----------------------------------------------------------------------------
// addSignalRow: insert or replace within the row's date bucket
// -----------------------------------------------------------------------------
void MarketDataStore::addSignalRow(domain::SignalRow row, bool complete) {
  auto& bucket = rows_by_date_[row.date];
  auto it = std::find_if(bucket.begin(), bucket.end(),
                         [&row](const StoredRow& stored) {
                           return stored.row.ticker == row.ticker;
                         });
  if (it != bucket.end()) {
    it->row = std::move(row);
    it->complete = complete;
    return;
  }
  bucket.push_back(StoredRow{std::move(row), complete});
}

void MarketDataStore::addBar(domain::PriceBar bar) {
  auto key = std::make_pair(bar.ticker, bar.date);
  bars_[key] = std::move(bar);
}

// -----------------------------------------------------------------------------
// signalsOn: complete rows with a positive margin balance
// -----------------------------------------------------------------------------
std::vector<domain::SignalRow> MarketDataStore::signalsOn(
    const domain::TradeDate& date) const {
  std::vector<domain::SignalRow> result;
  auto it = rows_by_date_.find(date);
  if (it == rows_by_date_.end()) {
    return result;
  }
  for (const auto& stored : it->second) {
    if (stored.complete && stored.row.balance_shares > 0.0) {
      result.push_back(stored.row);
    }
  }
  return result;
}

std::optional<domain::SignalRow> MarketDataStore::signalRow(
    const std::string& ticker, const domain::TradeDate& date) const {
  const StoredRow* stored = findRow(ticker, date);
  if (stored == nullptr) {
    return std::nullopt;
  }
  return stored->row;
}

std::optional<domain::PriceBar> MarketDataStore::bar(
    const std::string& ticker, const domain::TradeDate& date) const {
  auto it = bars_.find(std::make_pair(ticker, date));
  if (it == bars_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// close: bar close first, signal-row close as fallback
// -----------------------------------------------------------------------------
std::optional<double> MarketDataStore::close(
    const std::string& ticker, const domain::TradeDate& date) const {
  auto bar_it = bars_.find(std::make_pair(ticker, date));
  if (bar_it != bars_.end() && bar_it->second.close > 0.0) {
    return bar_it->second.close;
  }
  const StoredRow* stored = findRow(ticker, date);
  if (stored != nullptr && stored->row.close > 0.0) {
    return stored->row.close;
  }
  return std::nullopt;
}

std::vector<domain::TradeDate> MarketDataStore::signalDates() const {
  std::vector<domain::TradeDate> dates;
  dates.reserve(rows_by_date_.size());
  for (const auto& [date, bucket] : rows_by_date_) {
    if (!bucket.empty()) {
      dates.push_back(date);
    }
  }
  return dates;
}

std::size_t MarketDataStore::signalRowCount() const {
  std::size_t count = 0;
  for (const auto& [date, bucket] : rows_by_date_) {
    count += bucket.size();
  }
  return count;
}

const MarketDataStore::StoredRow* MarketDataStore::findRow(
    const std::string& ticker, const domain::TradeDate& date) const {
  auto it = rows_by_date_.find(date);
  if (it == rows_by_date_.end()) {
    return nullptr;
  }
  for (const auto& stored : it->second) {
    if (stored.row.ticker == ticker) {
      return &stored;
    }
  }
  return nullptr;
}

}  // namespace mrbt
