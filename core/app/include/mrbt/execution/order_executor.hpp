#pragma once

#include "mrbt/calendar/i_trading_calendar.hpp"
#include "mrbt/data/i_price_repository.hpp"
#include "mrbt/domain/strategy_params.hpp"
#include "mrbt/domain/trade.hpp"
#include "mrbt/state/engine_state.hpp"

#include <cstdint>
#include <string>

namespace mrbt {

// -----------------------------------------------------------------------------
// LotSizing: result of the position-sizing rule
// -----------------------------------------------------------------------------
struct LotSizing {
  std::int64_t shares{0};
  bool is_odd_lot{false};
};

// -----------------------------------------------------------------------------
// BuyRequest: one entry to execute or place
// -----------------------------------------------------------------------------
// price is the fill price for a market entry and the limit price for a
// limit entry. fill_date is the session the order executes on.
// -----------------------------------------------------------------------------
struct BuyRequest {
  std::string ticker;
  std::string display_name;
  double price{0.0};
  domain::TradeDate fill_date;
  domain::TradeDate signal_date;
};

// -----------------------------------------------------------------------------
// OrderExecutor: sizing, cash checks and trade recording
// -----------------------------------------------------------------------------
//
// @brief  Executes BUYs and SELLs against an EngineState and returns the
//         next state plus the Trade records. Fills are immediate and exact:
//         the order price is the fill price, with no slippage.
//
// @details
// Entry sizing (sizeOrder):
//   notional   = cash * position_size_ratio
//   raw_shares = floor(notional / price)
//   raw_shares <  board_lot → odd-lot order of raw_shares
//   raw_shares >= board_lot → round down to whole lots
//
// BUY checks, in order, each a rejection with no state change:
//   1. Existing position past its re-entry window
//        (elapsedTradingDays(entry_signal_date, signal_date) >= holding_period)
//   2. Zero shares after sizing
//   3. value + commission > cash
//
// A successful BUY debits cash, opens or merges the position and, when
// stop-loss is enabled, re-arms the stop order from the new weighted cost.
//
// SELL is always a full exit. Commission uses the odd-lot minimum when the
// position is smaller than one board lot; tax uses the day-trade rate when
// the position's entry_date equals the sell date.
//
// Two entry paths are offered:
//   buy()              market entry at the given price (EntryMode::MarketAtOpen)
//   placeLimitOrder()  + fillLimitOrders()  (EntryMode::LimitAtSignalOpen)
//
// Thread model:
//   Stateless apart from const configuration; every method is const and
//   operates only on the state passed in.
// -----------------------------------------------------------------------------
class OrderExecutor {
 public:
  OrderExecutor(const domain::StrategyParams& params,
                const ITradingCalendar& calendar);

  // Applies the sizing rule to the given cash and price. Returns zero shares
  // for a non-positive price.
  LotSizing sizeOrder(double cash, double price) const;

  // -------------------------------------------------------------------------
  // buy(state, request)
  // -------------------------------------------------------------------------
  // @brief  Market entry: sizes from state.cash and fills at request.price.
  //
  // @return Next state with one BUY trade, or the unchanged state with one
  //         OrderRejection.
  // -------------------------------------------------------------------------
  StepResult buy(EngineState state, const BuyRequest& request) const;

  // -------------------------------------------------------------------------
  // sell(state, ticker, price, date, reason)
  // -------------------------------------------------------------------------
  // @brief  Closes the full position at `price`.
  //
  // @return Next state with one SELL trade. If no position is open for the
  //         ticker the state is returned unchanged with no trade.
  // -------------------------------------------------------------------------
  StepResult sell(EngineState state, const std::string& ticker, double price,
                  const domain::TradeDate& date,
                  domain::ExitReason reason) const;

  // -------------------------------------------------------------------------
  // placeLimitOrder(state, request)
  // -------------------------------------------------------------------------
  // @brief  Sizes and cash-checks a limit buy at request.price and queues it
  //         for request.fill_date. No cash moves until it fills.
  // -------------------------------------------------------------------------
  StepResult placeLimitOrder(EngineState state,
                             const BuyRequest& request) const;

  // -------------------------------------------------------------------------
  // fillLimitOrders(state, date, prices)
  // -------------------------------------------------------------------------
  // @brief  Resolves every queued limit order due on or before `date`.
  //
  // @details
  // An order fills at its limit price when the day's bar has a low at or
  // below the limit (cash is checked again at fill time). Otherwise it
  // expires with LimitNotReached, or MissingPriceBar when there is no bar.
  // Orders due after `date` stay queued.
  // -------------------------------------------------------------------------
  StepResult fillLimitOrders(EngineState state, const domain::TradeDate& date,
                             const IPriceRepository& prices) const;

  const domain::StrategyParams& params() const { return params_; }

 private:
  // True when an open position for the ticker is past its re-entry window
  // as of signal_date.
  bool reentryWindowElapsed(const EngineState& state,
                            const std::string& ticker,
                            const domain::TradeDate& signal_date) const;

  // Debits cash, updates the ledger and builds the BUY record. The caller
  // has already checked shares > 0.
  StepResult executeBuy(EngineState state, const BuyRequest& request,
                        LotSizing sizing, domain::EntryMode mode) const;

  const domain::StrategyParams params_;
  const ITradingCalendar& calendar_;
};

}  // namespace mrbt
