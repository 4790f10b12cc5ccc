#include <gtest/gtest.h>

#include "dataset_validator.hpp"
#include "exceptions.hpp"
#include "result_tables.hpp"
#include "test_helpers.hpp"

using testing_helpers::ts;

TEST(ResultTablesTest, TradeLogColumnsAndFormatting) {
    core::TradeLogEntry buy;
    buy.timestamp = ts("2024-01-01T00:00:00Z");
    buy.action = core::TradeAction::Buy;
    buy.symbol = "LDO";
    buy.shares = 4.995;
    buy.price = 100.0;
    buy.fees = 0.5;
    buy.cash_after = 500.0;
    buy.portfolio_value_after = 999.5;
    buy.cost_basis = 100.0;

    core::TradeLogEntry sell = buy;
    sell.action = core::TradeAction::Sell;
    sell.realized_pnl = -0.5;

    data::Table table = simulator::tradeLogToTable({buy, sell});

    EXPECT_EQ(table.columns, (std::vector<std::string>{"timestamp", "action", "symbol", "shares", "price", "fees",
                                                       "cash", "portfolio_value", "cost_basis", "realized_pnl"}));
    ASSERT_EQ(table.rowCount(), 2u);
    EXPECT_EQ(table.rows[0], (std::vector<std::string>{"2024-01-01T00:00:00Z", "BUY", "LDO", "4.995", "100", "0.5",
                                                       "500", "999.5", "100", ""}));
    EXPECT_EQ(table.rows[1][1], "SELL");
    EXPECT_EQ(table.rows[1][9], "-0.5");
    EXPECT_NO_THROW(data::DatasetValidator::validateTradeLogTable(table));
}

TEST(ResultTablesTest, EquityCurveAndRejections) {
    core::PortfolioState point;
    point.timestamp = ts("2024-01-01T01:00:00Z");
    point.cash = 500.0;
    point.positions_value = 549.45;
    point.total_equity = 1049.45;

    data::Table equity = simulator::equityCurveToTable({point});
    EXPECT_EQ(equity.columns, (std::vector<std::string>{"timestamp", "cash", "positions_value", "portfolio_value"}));
    EXPECT_EQ(equity.rows[0][0], "2024-01-01T01:00:00Z");
    EXPECT_EQ(equity.rows[0][3], "1049.45");

    simulator::RejectionRecord rejection;
    rejection.timestamp = point.timestamp;
    rejection.symbol = "ETH";
    rejection.signal = core::SignalType::Sell;
    rejection.reason = simulator::RejectionReason::NoPosition;
    rejection.message = "SELL ETH at 2024-01-01T01:00:00Z rejected: no position found";

    data::Table rejections = simulator::rejectionsToTable({rejection});
    EXPECT_EQ(rejections.columns, (std::vector<std::string>{"timestamp", "symbol", "signal", "reason", "message"}));
    EXPECT_EQ(rejections.rows[0][2], "SELL");
    EXPECT_EQ(rejections.rows[0][3], "NoPosition");
}

TEST(ResultTablesTest, TradeLogWithNonFiniteCashIsNotWritten) {
    core::TradeLogEntry entry;
    entry.timestamp = ts("2024-01-01T00:00:00Z");
    entry.symbol = "LDO";
    entry.cash_after = testing_helpers::kNaN;
    entry.portfolio_value_after = 1000.0;

    EXPECT_THROW(simulator::tradeLogToTable({entry}), core::IntegrityException);

    entry.cash_after = 0.0;
    entry.portfolio_value_after = std::numeric_limits<double>::infinity();
    EXPECT_THROW(simulator::tradeLogToTable({entry}), core::IntegrityException);
}
