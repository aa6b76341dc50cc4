#include "mrbt/domain/trade.hpp"

namespace mrbt {
namespace domain {

const char* toString(TradeAction action) {
  switch (action) {
    case TradeAction::Buy:
      return "BUY";
    case TradeAction::Sell:
      return "SELL";
  }
  return "UNKNOWN";
}

// The lowercase spellings are what the trade ledger CSV and the JSON report
// carry in their `reason` column.
const char* toString(ExitReason reason) {
  switch (reason) {
    case ExitReason::TakeProfit:
      return "take_profit";
    case ExitReason::StopLoss:
      return "stop_loss";
    case ExitReason::HoldingPeriod:
      return "holding_period";
  }
  return "unknown";
}

const char* toString(EntryMode mode) {
  switch (mode) {
    case EntryMode::MarketAtOpen:
      return "market";
    case EntryMode::LimitAtSignalOpen:
      return "limit";
  }
  return "unknown";
}

std::optional<EntryMode> parseEntryMode(const std::string& text) {
  if (text == "market") {
    return EntryMode::MarketAtOpen;
  }
  if (text == "limit") {
    return EntryMode::LimitAtSignalOpen;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace mrbt
