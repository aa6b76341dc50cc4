#pragma once

#include "mrbt/domain/trade.hpp"
#include "mrbt/report/performance_report.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace mrbt {
namespace report {

// -----------------------------------------------------------------------------
// Trade ledger CSV
// -----------------------------------------------------------------------------
// One header line, then one line per Trade in ledger order. Sell-only and
// buy-only columns are left empty on the other side.
// -----------------------------------------------------------------------------
void writeTradeLedgerCsv(std::ostream& out,
                         const std::vector<domain::Trade>& trades);

// Throws std::runtime_error if the file cannot be opened.
void writeTradeLedgerCsv(const std::string& path,
                         const std::vector<domain::Trade>& trades);

// -----------------------------------------------------------------------------
// JSON performance summary
// -----------------------------------------------------------------------------
nlohmann::json toJson(const PerformanceSummary& summary);

// Writes toJson(summary) pretty-printed. Throws std::runtime_error if the
// file cannot be opened.
void writeSummaryJson(const std::string& path,
                      const PerformanceSummary& summary);

// Human-readable summary for the console.
void printSummary(std::ostream& out, const PerformanceSummary& summary);

}  // namespace report
}  // namespace mrbt
