#include <gtest/gtest.h>

#include <string>

#include "exceptions.hpp"
#include "position_ledger.hpp"
#include "test_helpers.hpp"
#include "trade_executor.hpp"

using simulator::ExecutionResult;
using simulator::PositionLedger;
using simulator::RejectionReason;
using simulator::TradeExecutor;
using testing_helpers::signal;

namespace {

    const std::string kT0 = "2024-01-01T00:00:00Z";
    const std::string kT1 = "2024-01-01T01:00:00Z";
    const std::string kT2 = "2024-01-01T02:00:00Z";

    core::Signal buy(double size, const std::string& time = kT0) {
        return signal(time, "LDO", core::SignalType::Buy, size);
    }

    core::Signal sell(double size, const std::string& time = kT1) {
        return signal(time, "LDO", core::SignalType::Sell, size);
    }

    void expectRejected(const ExecutionResult& result, RejectionReason reason) {
        ASSERT_FALSE(result.isExecuted());
        EXPECT_EQ(result.getRejection().reason, reason) << result.getRejection().message;
    }

} // namespace

TEST(TradeExecutorTest, BuyHalfOfCash) {
    PositionLedger ledger(1000.0);
    TradeExecutor executor(0.001);

    auto result = executor.execute(buy(0.5), ledger, 100.0);

    ASSERT_TRUE(result.isExecuted());
    const auto& entry = result.getEntry();
    EXPECT_EQ(entry.action, core::TradeAction::Buy);
    EXPECT_NEAR(entry.shares, 4.995, 1e-12);
    EXPECT_NEAR(entry.fees, 0.5, 1e-12);
    EXPECT_NEAR(entry.cash_after, 500.0, 1e-9);
    EXPECT_NEAR(entry.portfolio_value_after, 999.5, 1e-9);
    EXPECT_DOUBLE_EQ(entry.cost_basis, 100.0);
    EXPECT_NEAR(ledger.getCash(), 500.0, 1e-9);
    EXPECT_NEAR(ledger.findPosition("LDO")->shares, 4.995, 1e-12);
}

TEST(TradeExecutorTest, FullAllocationNeverOverdrawsCash) {
    for (double price : {3.0, 7.0, 0.1234567, 98765.4321}) {
        PositionLedger ledger(1000.0);
        TradeExecutor executor(0.001);

        auto result = executor.execute(buy(1.0), ledger, price);

        ASSERT_TRUE(result.isExecuted()) << "price " << price;
        EXPECT_GE(ledger.getCash(), 0.0) << "price " << price;
        EXPECT_NEAR(ledger.getCash(), 0.0, 1e-6) << "price " << price;
    }
}

TEST(TradeExecutorTest, SecondBuyAveragesCostBasis) {
    PositionLedger ledger(1000.0);
    TradeExecutor executor(0.0);

    ASSERT_TRUE(executor.execute(buy(0.5, kT0), ledger, 100.0).isExecuted());
    auto second = executor.execute(buy(1.0, kT1), ledger, 125.0);

    ASSERT_TRUE(second.isExecuted());
    EXPECT_NEAR(second.getEntry().shares, 4.0, 1e-12);
    EXPECT_NEAR(ledger.findPosition("LDO")->shares, 9.0, 1e-12);
    EXPECT_NEAR(second.getEntry().cost_basis, 1000.0 / 9.0, 1e-9);
    EXPECT_NEAR(ledger.getCash(), 0.0, 1e-9);
}

TEST(TradeExecutorTest, BuyRejections) {
    TradeExecutor executor(0.001);

    PositionLedger ledger(1000.0);
    expectRejected(executor.execute(buy(0.0), ledger, 100.0), RejectionReason::ZeroPositionSize);
    expectRejected(executor.execute(buy(-0.5), ledger, 100.0), RejectionReason::InvalidAllocation);
    expectRejected(executor.execute(buy(0.5), ledger, testing_helpers::kNaN), RejectionReason::InvalidPrice);
    expectRejected(executor.execute(buy(0.5), ledger, -5.0), RejectionReason::NegativePrice);
    expectRejected(executor.execute(buy(0.5), ledger, 0.0), RejectionReason::InvalidShareCount);

    PositionLedger broke(0.0);
    expectRejected(executor.execute(buy(0.5), broke, 100.0), RejectionReason::NoCashAvailable);

    // Nothing above may touch the ledger
    EXPECT_DOUBLE_EQ(ledger.getCash(), 1000.0);
    EXPECT_TRUE(ledger.getPositions().empty());
}

TEST(TradeExecutorTest, FullFeeRateRejectsBuy) {
    PositionLedger ledger(1000.0);
    TradeExecutor executor(1.0);

    expectRejected(executor.execute(buy(0.5), ledger, 100.0), RejectionReason::FeesExceedAllocation);
    EXPECT_DOUBLE_EQ(ledger.getCash(), 1000.0);
    EXPECT_TRUE(ledger.getPositions().empty());
}

TEST(TradeExecutorTest, InsufficientFundsReportsAmounts) {
    PositionLedger ledger(1000.0);
    TradeExecutor executor(0.001);

    auto result = executor.execute(buy(1.5), ledger, 100.0);

    expectRejected(result, RejectionReason::InsufficientFunds);
    const std::string& message = result.getRejection().message;
    EXPECT_NE(message.find("required 1500.00000"), std::string::npos) << message;
    EXPECT_NE(message.find("available 1000.00000"), std::string::npos) << message;
    EXPECT_DOUBLE_EQ(ledger.getCash(), 1000.0);
}

TEST(TradeExecutorTest, RejectionMessageNamesSymbolAndTime) {
    PositionLedger ledger(1000.0);
    TradeExecutor executor(0.001);

    auto result = executor.execute(sell(1.0), ledger, 100.0);

    expectRejected(result, RejectionReason::NoPosition);
    const std::string& message = result.getRejection().message;
    EXPECT_NE(message.find("LDO"), std::string::npos);
    EXPECT_NE(message.find(kT1), std::string::npos);
    EXPECT_NE(message.find("no position found"), std::string::npos);
    EXPECT_DOUBLE_EQ(ledger.getCash(), 1000.0);
}

TEST(TradeExecutorTest, PartialThenFullSellRealizesPnl) {
    PositionLedger ledger(1000.0);
    TradeExecutor executor(0.0);
    ASSERT_TRUE(executor.execute(buy(1.0), ledger, 100.0).isExecuted());

    auto partial = executor.execute(sell(0.5, kT1), ledger, 120.0);
    ASSERT_TRUE(partial.isExecuted());
    EXPECT_NEAR(partial.getEntry().shares, 5.0, 1e-12);
    EXPECT_NEAR(partial.getEntry().realized_pnl, 100.0, 1e-9);
    EXPECT_NEAR(partial.getEntry().realized_return_pct, 0.2, 1e-12);
    EXPECT_FALSE(partial.getEntry().closed_position);
    EXPECT_NEAR(ledger.getCash(), 600.0, 1e-9);
    EXPECT_DOUBLE_EQ(ledger.findPosition("LDO")->average_cost_basis, 100.0);

    auto full = executor.execute(sell(1.0, kT2), ledger, 80.0);
    ASSERT_TRUE(full.isExecuted());
    EXPECT_NEAR(full.getEntry().realized_pnl, -100.0, 1e-9);
    EXPECT_TRUE(full.getEntry().closed_position);
    EXPECT_FALSE(ledger.hasOpenPosition("LDO"));
    EXPECT_NEAR(ledger.getCash(), 1000.0, 1e-9);
    EXPECT_NEAR(full.getEntry().portfolio_value_after, 1000.0, 1e-9);
}

TEST(TradeExecutorTest, SellChargesFeesOnGrossProceeds) {
    PositionLedger ledger(0.0);
    ledger.applyBuy("LDO", 10.0, 100.0, 0.0, testing_helpers::ts(kT0));
    TradeExecutor executor(0.01);

    auto result = executor.execute(sell(1.0), ledger, 100.0);

    ASSERT_TRUE(result.isExecuted());
    EXPECT_NEAR(result.getEntry().fees, 10.0, 1e-9);
    EXPECT_NEAR(ledger.getCash(), 990.0, 1e-9);
    EXPECT_NEAR(result.getEntry().realized_pnl, -10.0, 1e-9);
}

TEST(TradeExecutorTest, SellRejections) {
    PositionLedger ledger(0.0);
    ledger.applyBuy("LDO", 10.0, 100.0, 0.0, testing_helpers::ts(kT0));
    TradeExecutor executor(0.001);

    expectRejected(executor.execute(sell(0.5), ledger, testing_helpers::kNaN), RejectionReason::InvalidPrice);
    expectRejected(executor.execute(sell(0.5), ledger, -1.0), RejectionReason::NegativePrice);
    expectRejected(executor.execute(sell(0.0), ledger, 100.0), RejectionReason::InvalidShareCount);
    expectRejected(executor.execute(sell(0.5), ledger, 0.0), RejectionReason::InvalidGrossProceeds);

    TradeExecutor all_fees(1.0);
    expectRejected(all_fees.execute(sell(0.5), ledger, 100.0), RejectionReason::FeesExceedProceeds);

    EXPECT_DOUBLE_EQ(ledger.findPosition("LDO")->shares, 10.0);
    EXPECT_DOUBLE_EQ(ledger.getCash(), 0.0);
}

TEST(TradeExecutorTest, ZeroCostBasisRejectsSell) {
    PositionLedger ledger(0.0);
    ledger.applyBuy("LDO", 10.0, 0.0, 0.0, testing_helpers::ts(kT0));
    TradeExecutor executor(0.001);

    expectRejected(executor.execute(sell(1.0), ledger, 10.0), RejectionReason::ZeroCostBasis);
}

TEST(TradeExecutorTest, HoldIsNotExecutable) {
    PositionLedger ledger(1000.0);
    TradeExecutor executor(0.001);
    EXPECT_THROW(executor.execute(signal(kT0, "LDO", core::SignalType::Hold, 0.0), ledger, 100.0),
                 core::SimulationException);
}

TEST(TradeExecutorTest, InvalidFeeRateIsAConfigError) {
    EXPECT_THROW(TradeExecutor(-0.1), core::ConfigException);
    EXPECT_THROW(TradeExecutor(1.1), core::ConfigException);
}

TEST(TradeExecutorTest, ExecutionResultAccessorsMatchKind) {
    auto rejected = ExecutionResult::rejected(RejectionReason::NoPosition, "no position found");
    EXPECT_THROW(rejected.getEntry(), core::SimulationException);
    EXPECT_EQ(simulator::toString(rejected.getRejection().reason), "NoPosition");

    auto executed = ExecutionResult::executed(core::TradeLogEntry{});
    EXPECT_THROW(executed.getRejection(), core::SimulationException);
}
