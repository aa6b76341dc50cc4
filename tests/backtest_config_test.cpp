// =============================================================================
// backtest_config_test.cpp
// =============================================================================
// Unit tests for mrbt::BacktestConfig loading and validation.
//
// Validates:
//   - Defaults
//   - JSON overlay and command-line overrides
//   - Rejection of bad capital, dates, entry modes and unknown flags
// =============================================================================

#include "mrbt/config/backtest_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

TEST(BacktestConfigTest, Defaults) {
  mrbt::BacktestConfig config;
  EXPECT_EQ(config.start_date, "20200101");
  EXPECT_EQ(config.end_date, "20251117");
  EXPECT_DOUBLE_EQ(config.initial_capital, 1'000'000.0);
  EXPECT_TRUE(config.enable_take_profit);
  EXPECT_TRUE(config.enable_stop_loss);
  EXPECT_EQ(config.entry_mode, mrbt::domain::EntryMode::MarketAtOpen);
}

TEST(BacktestConfigTest, JsonOverlaysOnlyPresentKeys) {
  mrbt::BacktestConfig config;
  mrbt::applyJson(config, nlohmann::json::parse(R"({
    "start_date": "20230101", "initial_capital": 250000,
    "enable_stop_loss": false, "entry_mode": "limit",
    "data_path": "market.json"
  })"));

  EXPECT_EQ(config.start_date, "20230101");
  EXPECT_EQ(config.end_date, "20251117");
  EXPECT_DOUBLE_EQ(config.initial_capital, 250'000.0);
  EXPECT_FALSE(config.enable_stop_loss);
  EXPECT_TRUE(config.enable_take_profit);
  EXPECT_EQ(config.entry_mode, mrbt::domain::EntryMode::LimitAtSignalOpen);
  EXPECT_EQ(config.data_path, "market.json");
}

TEST(BacktestConfigTest, WronglyTypedJsonValueThrows) {
  mrbt::BacktestConfig config;
  EXPECT_THROW(mrbt::applyJson(config, nlohmann::json::parse(
                                           R"({"initial_capital": "lots"})")),
               nlohmann::json::exception);
}

TEST(BacktestConfigTest, CommandLineFlags) {
  auto config = mrbt::parseCommandLine(
      {"--data", "market.json", "--start", "20240101", "--end", "20241231",
       "--capital", "500000", "--no-take-profit", "--no-stop-loss",
       "--entry-mode", "limit", "--trades-out", "trades.csv", "--report-out",
       "report.json"});

  EXPECT_EQ(config.data_path, "market.json");
  EXPECT_EQ(config.start_date, "20240101");
  EXPECT_EQ(config.end_date, "20241231");
  EXPECT_DOUBLE_EQ(config.initial_capital, 500'000.0);
  EXPECT_FALSE(config.enable_take_profit);
  EXPECT_FALSE(config.enable_stop_loss);
  EXPECT_EQ(config.entry_mode, mrbt::domain::EntryMode::LimitAtSignalOpen);
  EXPECT_EQ(config.trades_out, "trades.csv");
  EXPECT_EQ(config.report_out, "report.json");
  EXPECT_NO_THROW(mrbt::validate(config));
}

TEST(BacktestConfigTest, HelpFlag) {
  EXPECT_TRUE(mrbt::parseCommandLine({"--help"}).show_help);
  EXPECT_NE(mrbt::usage("mrbt_backtest").find("--entry-mode"),
            std::string::npos);
}

TEST(BacktestConfigTest, BadArgumentsThrow) {
  using Args = std::vector<std::string>;
  EXPECT_THROW(mrbt::parseCommandLine(Args{"--bogus"}), std::invalid_argument);
  EXPECT_THROW(mrbt::parseCommandLine(Args{"--start"}), std::invalid_argument);
  EXPECT_THROW(mrbt::parseCommandLine(Args{"--capital", "abc"}),
               std::invalid_argument);
  EXPECT_THROW(mrbt::parseCommandLine(Args{"--capital", "10x"}),
               std::invalid_argument);
  EXPECT_THROW(mrbt::parseCommandLine(Args{"--entry-mode", "stop"}),
               std::invalid_argument);
}

TEST(BacktestConfigTest, MissingConfigFileThrows) {
  EXPECT_THROW(
      mrbt::parseCommandLine({"--config", "/nonexistent/mrbt/config.json"}),
      std::runtime_error);
}

TEST(BacktestConfigTest, ValidationRejectsBadSettings) {
  mrbt::BacktestConfig config;
  config.data_path = "market.json";
  EXPECT_NO_THROW(mrbt::validate(config));

  auto bad = config;
  bad.initial_capital = 0.0;
  EXPECT_THROW(mrbt::validate(bad), std::invalid_argument);

  bad = config;
  bad.initial_capital = -5.0;
  EXPECT_THROW(mrbt::validate(bad), std::invalid_argument);

  bad = config;
  bad.start_date = "2024-01-01";
  EXPECT_THROW(mrbt::validate(bad), std::invalid_argument);

  bad = config;
  bad.start_date = "20250101";
  bad.end_date = "20240101";
  EXPECT_THROW(mrbt::validate(bad), std::invalid_argument);

  bad = config;
  bad.data_path.clear();
  EXPECT_THROW(mrbt::validate(bad), std::invalid_argument);
}
