#include "mrbt/report/report_writer.hpp"

#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace mrbt {
namespace report {

namespace {

// Quotes a field if it contains a separator, quote or newline.
std::string csvField(const std::string& text) {
  if (text.find_first_of(",\"\n") == std::string::npos) {
    return text;
  }
  std::string quoted = "\"";
  for (char c : text) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

template <typename T>
void optionalField(std::ostream& out, const std::optional<T>& value) {
  if (value) {
    out << *value;
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// writeTradeLedgerCsv
// -----------------------------------------------------------------------------
void writeTradeLedgerCsv(std::ostream& out,
                         const std::vector<domain::Trade>& trades) {
  out << "date,action,ticker,stock_name,shares,price,value,commission,tax,"
         "net_amount,is_odd_lot,signal_date,entry_mode,entry_cost,pnl,"
         "pnl_pct,reason,holding_days\n";

  out << std::fixed << std::setprecision(4);
  for (const auto& t : trades) {
    bool is_sell = t.action == domain::TradeAction::Sell;

    out << t.date << ',' << toString(t.action) << ',' << csvField(t.ticker)
        << ',' << csvField(t.display_name) << ',' << t.shares << ','
        << t.price << ',' << t.value << ',' << t.commission << ',' << t.tax
        << ',' << t.net_amount << ',' << (t.is_odd_lot ? 1 : 0) << ','
        << t.signal_date << ',';
    if (t.entry_mode) {
      out << toString(*t.entry_mode);
    }
    out << ',';
    if (is_sell) {
      out << t.entry_cost;
    }
    out << ',';
    optionalField(out, t.pnl);
    out << ',';
    optionalField(out, t.pnl_pct);
    out << ',';
    if (t.reason) {
      out << toString(*t.reason);
    }
    out << ',';
    if (is_sell) {
      out << t.holding_days;
    }
    out << '\n';
  }
}

void writeTradeLedgerCsv(const std::string& path,
                         const std::vector<domain::Trade>& trades) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open trade ledger output: " + path);
  }
  writeTradeLedgerCsv(file, trades);
}

// -----------------------------------------------------------------------------
// toJson
// -----------------------------------------------------------------------------
nlohmann::json toJson(const PerformanceSummary& s) {
  nlohmann::json j;
  j["initial_capital"] = s.initial_capital;
  j["final_cash"] = s.final_cash;
  j["final_value"] = s.final_value;
  j["total_return"] = s.total_return;
  j["trading_days"] = s.trading_days;
  j["buy_count"] = s.buy_count;
  j["sell_count"] = s.sell_count;
  j["winning_sells"] = s.winning_sells;
  j["win_rate"] = s.win_rate;
  j["total_pnl"] = s.total_pnl;
  j["avg_pnl_pct"] = s.avg_pnl_pct;
  j["avg_win"] = s.avg_win;
  j["avg_loss"] = s.avg_loss;
  j["max_drawdown"] = s.max_drawdown;
  j["sharpe_ratio"] =
      s.sharpe_ratio ? nlohmann::json(*s.sharpe_ratio) : nlohmann::json();

  nlohmann::json reasons = nlohmann::json::object();
  for (const auto& entry : s.by_reason) {
    reasons[entry.first] = {{"count", entry.second.count},
                            {"avg_pnl_pct", entry.second.avg_pnl_pct}};
  }
  j["exit_reasons"] = reasons;

  nlohmann::json open = nlohmann::json::array();
  for (const auto& pos : s.open_positions) {
    nlohmann::json p;
    p["ticker"] = pos.ticker;
    p["stock_name"] = pos.display_name;
    p["shares"] = pos.shares;
    p["weighted_cost"] = pos.weighted_cost;
    p["entry_date"] = pos.entry_date;
    p["last_close"] =
        pos.last_close ? nlohmann::json(*pos.last_close) : nlohmann::json();
    p["market_value"] = pos.market_value;
    open.push_back(p);
  }
  j["open_positions"] = open;
  return j;
}

void writeSummaryJson(const std::string& path,
                      const PerformanceSummary& summary) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open summary output: " + path);
  }
  file << toJson(summary).dump(2) << '\n';
}

// -----------------------------------------------------------------------------
// printSummary
// -----------------------------------------------------------------------------
void printSummary(std::ostream& out, const PerformanceSummary& s) {
  std::ios_base::fmtflags flags = out.flags();
  std::streamsize precision = out.precision();

  out << std::fixed << std::setprecision(2);
  out << "==================== Backtest Summary ====================\n";
  out << "Trading days:        " << s.trading_days << '\n';
  out << "Initial capital:     " << s.initial_capital << '\n';
  out << "Final cash:          " << s.final_cash << '\n';
  out << "Final value:         " << s.final_value << '\n';
  out << "Total return:        " << s.total_return * 100.0 << "%\n";
  out << "Buys / sells:        " << s.buy_count << " / " << s.sell_count
      << '\n';
  out << "Win rate:            " << s.win_rate * 100.0 << "% ("
      << s.winning_sells << " winners)\n";
  out << "Total pnl:           " << s.total_pnl << '\n';
  out << "Average pnl:         " << s.avg_pnl_pct << "%\n";
  out << "Average win / loss:  " << s.avg_win << " / " << s.avg_loss << '\n';

  for (const auto& entry : s.by_reason) {
    out << "  " << std::left << std::setw(16) << entry.first << std::right
        << entry.second.count << " exits, avg " << entry.second.avg_pnl_pct
        << "%\n";
  }

  out << std::setprecision(4);
  out << "Sharpe ratio:        ";
  if (s.sharpe_ratio) {
    out << *s.sharpe_ratio << '\n';
  } else {
    out << "n/a\n";
  }
  out << std::setprecision(2);
  out << "Max drawdown:        " << s.max_drawdown * 100.0 << "%\n";

  if (!s.open_positions.empty()) {
    out << "Open positions at end: " << s.open_positions.size() << '\n';
    for (const auto& pos : s.open_positions) {
      out << "  " << pos.ticker << ' ' << pos.display_name << "  "
          << pos.shares << " @ " << pos.weighted_cost << "  last ";
      if (pos.last_close) {
        out << *pos.last_close;
      } else {
        out << "n/a";
      }
      out << "  value " << pos.market_value << '\n';
    }
  }
  out << "==========================================================\n";

  out.flags(flags);
  out.precision(precision);
}

}  // namespace report
}  // namespace mrbt
