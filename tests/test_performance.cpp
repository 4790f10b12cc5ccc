#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "performance.hpp"
#include "test_helpers.hpp"

using metrics::PerformanceCalculator;

namespace {

    std::vector<core::PortfolioState> curve(const std::vector<double>& equity) {
        std::vector<core::PortfolioState> points;
        auto time = testing_helpers::ts("2024-01-01T00:00:00Z");
        for (double value : equity) {
            core::PortfolioState state;
            state.timestamp = time;
            state.cash = value;
            state.total_equity = value;
            points.push_back(state);
            time += std::chrono::hours(1);
        }
        return points;
    }

    core::TradeLogEntry trade(core::TradeAction action, double fees, double pnl = 0.0, bool closed = false) {
        core::TradeLogEntry entry;
        entry.action = action;
        entry.symbol = "LDO";
        entry.fees = fees;
        entry.realized_pnl = pnl;
        entry.closed_position = closed;
        return entry;
    }

} // namespace

TEST(PerformanceTest, MaxDrawdownStartsFromInitialValue) {
    EXPECT_NEAR(PerformanceCalculator::maxDrawdownPct(curve({110, 88, 120}), 100.0), 20.0, 1e-9);
    EXPECT_NEAR(PerformanceCalculator::maxDrawdownPct(curve({90, 95}), 100.0), 10.0, 1e-9);
    EXPECT_DOUBLE_EQ(PerformanceCalculator::maxDrawdownPct({}, 100.0), 0.0);
}

TEST(PerformanceTest, ReturnsIncludeFirstPointAgainstInitialValue) {
    auto returns = PerformanceCalculator::equityReturns(curve({110, 99}), 100.0);
    ASSERT_EQ(returns.size(), 2u);
    EXPECT_NEAR(returns[0], 0.1, 1e-12);
    EXPECT_NEAR(returns[1], -0.1, 1e-12);
}

TEST(PerformanceTest, SharpeUsesPopulationDeviation) {
    EXPECT_NEAR(PerformanceCalculator::sharpeRatio({0.01, 0.03}, 252.0), 2.0 * std::sqrt(252.0), 1e-9);
    EXPECT_DOUBLE_EQ(PerformanceCalculator::sharpeRatio({0.05}, 252.0), 0.0);
    EXPECT_DOUBLE_EQ(PerformanceCalculator::sharpeRatio({0.02, 0.02, 0.02}, 252.0), 0.0);
}

TEST(PerformanceTest, CalculateAggregatesTrades) {
    simulator::SimulationResult result;
    result.initial_cash = 1000.0;
    result.final_portfolio_value = 1020.0;
    result.equity_curve = curve({1000.0, 1030.0, 1020.0});
    result.trade_log = {trade(core::TradeAction::Buy, 1.0),
                        trade(core::TradeAction::Sell, 0.5, 30.0, false),
                        trade(core::TradeAction::Sell, 0.5, -10.0, true)};
    result.rejections.resize(2);

    auto perf = PerformanceCalculator().calculate(result);

    EXPECT_NEAR(perf.total_return_pct, 2.0, 1e-9);
    EXPECT_NEAR(perf.total_pnl, 20.0, 1e-9);
    EXPECT_NEAR(perf.total_fees, 2.0, 1e-12);
    EXPECT_EQ(perf.total_executions, 3);
    EXPECT_EQ(perf.buy_count, 1);
    EXPECT_EQ(perf.sell_count, 2);
    EXPECT_EQ(perf.round_trip_trades, 1);
    EXPECT_DOUBLE_EQ(perf.win_rate, 0.5);
    EXPECT_NEAR(perf.profit_factor, 3.0, 1e-12);
    EXPECT_NEAR(perf.avg_win_pnl, 30.0, 1e-12);
    EXPECT_NEAR(perf.avg_loss_pnl, -10.0, 1e-12);
    EXPECT_EQ(perf.rejected_signals, 2u);
    EXPECT_NEAR(perf.max_drawdown_pct, 10.0 / 1030.0 * 100.0, 1e-9);
}

TEST(PerformanceTest, NoLossesGivesInfiniteProfitFactorAndNullJson) {
    simulator::SimulationResult result;
    result.initial_cash = 1000.0;
    result.final_portfolio_value = 1010.0;
    result.trade_log = {trade(core::TradeAction::Buy, 0.0),
                        trade(core::TradeAction::Sell, 0.0, 10.0, true)};

    auto perf = PerformanceCalculator().calculate(result);
    EXPECT_TRUE(std::isinf(perf.profit_factor));

    auto report = metrics::toJson(perf, metrics::scoreSubmission(perf, core::ScoringConfig{}));
    EXPECT_TRUE(report["metrics"]["profit_factor"].is_null());
    EXPECT_EQ(report["metrics"]["sell_count"].get<int>(), 1);
    EXPECT_TRUE(report["score"].contains("qualifies"));
}

TEST(PerformanceTest, EmptyRunHasZeroMetrics) {
    simulator::SimulationResult result;
    result.initial_cash = 1000.0;
    result.final_portfolio_value = 1000.0;

    auto perf = PerformanceCalculator().calculate(result);
    EXPECT_DOUBLE_EQ(perf.total_return_pct, 0.0);
    EXPECT_DOUBLE_EQ(perf.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(perf.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(perf.profit_factor, 0.0);
}

TEST(PerformanceTest, ScoreComponentsAreClamped) {
    metrics::PerformanceMetrics perf;
    perf.total_return_pct = 10.0;
    perf.sharpe_ratio = 3.0;
    perf.max_drawdown_pct = 5.0;

    auto score = metrics::scoreSubmission(perf, core::ScoringConfig{});
    EXPECT_NEAR(score.profitability, 22.5, 1e-12);
    EXPECT_DOUBLE_EQ(score.sharpe, 35.0);
    EXPECT_NEAR(score.drawdown, 15.0, 1e-12);
    EXPECT_NEAR(score.total, 72.5, 1e-12);
    EXPECT_TRUE(score.qualifies);

    perf.total_return_pct = -4.0;
    perf.max_drawdown_pct = 25.0;
    score = metrics::scoreSubmission(perf, core::ScoringConfig{});
    EXPECT_DOUBLE_EQ(score.profitability, 0.0);
    EXPECT_DOUBLE_EQ(score.drawdown, 0.0);
    EXPECT_FALSE(score.qualifies);
}

TEST(PerformanceTest, QualificationNeedsEveryThreshold) {
    metrics::PerformanceMetrics perf;
    perf.total_return_pct = 30.0; // profitability capped at 45
    perf.sharpe_ratio = 0.4;      // 7 points, under the 10 point minimum
    perf.max_drawdown_pct = 0.0;

    auto score = metrics::scoreSubmission(perf, core::ScoringConfig{});
    EXPECT_DOUBLE_EQ(score.profitability, 45.0);
    EXPECT_GE(score.total, 50.0);
    EXPECT_FALSE(score.qualifies);
}
