#pragma once

#include <cstddef>
#include <vector>

#include "config.hpp"
#include "datatypes.hpp"
#include "logging.hpp"
#include "simulation_driver.hpp"

namespace metrics {

    // --- Performance Metrics Struct ---
    // Percentages are expressed in percent (12.5 means 12.5%)
    struct PerformanceMetrics {
        double initial_value = 0.0;
        double final_value = 0.0;
        double total_return_pct = 0.0;
        double total_pnl = 0.0;
        double total_fees = 0.0;
        double max_drawdown_pct = 0.0;  // Positive number
        double sharpe_ratio = 0.0;      // Annualised, zero risk-free rate
        int total_executions = 0;
        int buy_count = 0;
        int sell_count = 0;
        int round_trip_trades = 0;      // SELLs that closed a position
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;          // Fraction of realized SELLs with positive PnL
        double profit_factor = 0.0;     // Gross Profit / Gross Loss
        double avg_win_pnl = 0.0;
        double avg_loss_pnl = 0.0;
        std::size_t rejected_signals = 0;

        void logMetrics() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Simulation Metrics ---");
            logger->info("Final Portfolio Value: {:.2f} (initial {:.2f})", final_value, initial_value);
            logger->info("Total Return: {:.2f}%", total_return_pct);
            logger->info("Total PnL: {:.2f}", total_pnl);
            logger->info("Total Fees: {:.2f}", total_fees);
            logger->info("Max Drawdown: {:.2f}%", max_drawdown_pct);
            logger->info("Sharpe Ratio: {:.3f}", sharpe_ratio);
            logger->info("Total Executions: {} ({} BUY / {} SELL)", total_executions, buy_count, sell_count);
            logger->info("Round-Trip Trades: {}", round_trip_trades);
            logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
            logger->info("Profit Factor: {:.2f}", profit_factor);
            logger->info("Avg Win PnL: {:.2f}", avg_win_pnl);
            logger->info("Avg Loss PnL: {:.2f}", avg_loss_pnl);
            logger->info("Rejected Signals: {}", rejected_signals);
            logger->info("--------------------------");
        }
    };

    // Competition score: profitability (max 45) + sharpe (max 35) + drawdown (max 20)
    struct SubmissionScore {
        double profitability = 0.0;
        double sharpe = 0.0;
        double drawdown = 0.0;
        double total = 0.0;
        bool qualifies = false;

        void logScore() const;
    };

    class PerformanceCalculator {
    public:
        explicit PerformanceCalculator(core::MetricsConfig config = {});

        PerformanceMetrics calculate(const simulator::SimulationResult& result) const;

        // Largest peak-to-trough decline in percent; the peak starts at initial_value
        static double maxDrawdownPct(const std::vector<core::PortfolioState>& equity_curve, double initial_value);
        // Per-point returns of initial_value followed by the curve's equity values
        static std::vector<double> equityReturns(const std::vector<core::PortfolioState>& equity_curve, double initial_value);
        // mean / population stddev * sqrt(periods_per_year); 0 for fewer than 2 returns or no variance
        static double sharpeRatio(const std::vector<double>& returns, double periods_per_year);

    private:
        core::MetricsConfig config_;
    };

    SubmissionScore scoreSubmission(const PerformanceMetrics& metrics, const core::ScoringConfig& scoring);

    // Metrics and score as written to metrics.json
    core::json toJson(const PerformanceMetrics& metrics, const SubmissionScore& score);

} // namespace metrics
