#pragma once

#include "mrbt/domain/signal_row.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace mrbt {

// -----------------------------------------------------------------------------
// Candidate: one ranked entry candidate for a single scan
// -----------------------------------------------------------------------------
// drop_pct is the relative fall of the margin ratio below its 10-day average,
// in percent. It is always negative for a candidate; more negative ranks
// first.
// -----------------------------------------------------------------------------
struct Candidate {
  domain::SignalRow row;
  double drop_pct{0.0};
};

// -----------------------------------------------------------------------------
// SignalScanner: two-stage cross-sectional filter
// -----------------------------------------------------------------------------
//
// @brief  Turns one date's signal table into an ordered list of entry
//         candidates.
//
// @details
// Stage 1 (drop filter):
//   keep rows with ratio < avg10_ratio, compute
//     drop_pct = (ratio - avg10_ratio) / avg10_ratio * 100
//   sort ascending by drop_pct and keep the first top_n.
//
// Stage 2 (confirmation), every condition required:
//   volume > avg10_volume
//   close  > open                      (bullish session)
//   balance_shares > avg5_balance_threshold
//
// The sort is stable, so rows with equal drop_pct keep the repository's
// order and the scan stays deterministic for identical inputs.
//
// Rows with balance_shares <= 0 or avg10_ratio <= 0 are ignored; the
// repository already excludes the former and the latter has no meaningful
// drop percentage.
//
// Thread model:
//   Stateless apart from top_n. scan() is const and reentrant.
// -----------------------------------------------------------------------------
class SignalScanner {
 public:
  explicit SignalScanner(std::size_t top_n = 10);

  // -------------------------------------------------------------------------
  // scan(rows)
  // -------------------------------------------------------------------------
  // @brief  Runs both stages over one date's rows.
  //
  // @param  rows  Every signal row for a single date.
  // @return Candidates that passed both stages, best-ranked first. Empty if
  //         none qualify.
  // -------------------------------------------------------------------------
  std::vector<Candidate> scan(const std::vector<domain::SignalRow>& rows) const;

  // Stage 1 test for a single row. Returns drop_pct when the margin ratio is
  // below its average, std::nullopt otherwise.
  static std::optional<double> dropPct(const domain::SignalRow& row);

  // Stage 2 test for a single row.
  static bool passesConfirmation(const domain::SignalRow& row);

  std::size_t topN() const { return top_n_; }

 private:
  std::size_t top_n_;
};

}  // namespace mrbt
