#include "performance.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace metrics {

    PerformanceCalculator::PerformanceCalculator(core::MetricsConfig config) : config_(config) {}

    double PerformanceCalculator::maxDrawdownPct(const std::vector<core::PortfolioState>& equity_curve, double initial_value) {
        double peak_equity = initial_value;
        double max_drawdown = 0.0;
        for (const auto& state : equity_curve) {
            peak_equity = std::max(peak_equity, state.total_equity);
            double current_drawdown = (peak_equity > 1e-9) ? (peak_equity - state.total_equity) / peak_equity : 0.0;
            max_drawdown = std::max(max_drawdown, current_drawdown);
        }
        return max_drawdown * 100.0;
    }

    std::vector<double> PerformanceCalculator::equityReturns(const std::vector<core::PortfolioState>& equity_curve,
                                                             double initial_value) {
        std::vector<double> returns;
        returns.reserve(equity_curve.size());
        double previous = initial_value;
        for (const auto& state : equity_curve) {
            if (previous > 1e-9) { // Avoid division by zero
                returns.push_back((state.total_equity / previous) - 1.0);
            } else {
                returns.push_back(0.0);
            }
            previous = state.total_equity;
        }
        return returns;
    }

    double PerformanceCalculator::sharpeRatio(const std::vector<double>& returns, double periods_per_year) {
        if (returns.size() < 2) return 0.0;

        double sum_returns = std::accumulate(returns.begin(), returns.end(), 0.0);
        double mean_return = sum_returns / returns.size();

        double sq_dev = 0.0;
        for (double r : returns) {
            sq_dev += (r - mean_return) * (r - mean_return);
        }
        double std_dev = std::sqrt(sq_dev / returns.size());
        if (std_dev <= 1e-12) return 0.0;

        return mean_return / std_dev * std::sqrt(periods_per_year);
    }

    PerformanceMetrics PerformanceCalculator::calculate(const simulator::SimulationResult& result) const {
        auto logger = core::logging::getLogger();
        logger->info("Calculating performance metrics...");

        PerformanceMetrics metrics;
        metrics.initial_value = result.initial_cash;
        metrics.final_value = result.final_portfolio_value;
        metrics.rejected_signals = result.rejections.size();

        // --- PnL and Return ---
        metrics.total_pnl = metrics.final_value - metrics.initial_value;
        metrics.total_return_pct = (metrics.initial_value > 1e-9) ? metrics.total_pnl / metrics.initial_value * 100.0 : 0.0;

        // --- Equity Curve Metrics ---
        metrics.max_drawdown_pct = maxDrawdownPct(result.equity_curve, metrics.initial_value);
        metrics.sharpe_ratio = sharpeRatio(equityReturns(result.equity_curve, metrics.initial_value),
                                           config_.periods_per_year);

        // --- Trade-Based Metrics ---
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        for (const auto& entry : result.trade_log) {
            metrics.total_executions++;
            metrics.total_fees += entry.fees;
            if (entry.action == core::TradeAction::Buy) {
                metrics.buy_count++;
                continue;
            }
            metrics.sell_count++;
            if (entry.closed_position) metrics.round_trip_trades++;
            if (entry.realized_pnl > 0) {
                metrics.winning_trades++;
                gross_profit += entry.realized_pnl;
            } else if (entry.realized_pnl < 0) {
                metrics.losing_trades++;
                gross_loss += entry.realized_pnl; // Loss is negative
            }
        }

        if (metrics.sell_count > 0) {
            metrics.win_rate = static_cast<double>(metrics.winning_trades) / metrics.sell_count;
        }

        if (std::abs(gross_loss) > 1e-9) {
            metrics.profit_factor = gross_profit / std::abs(gross_loss);
        } else if (gross_profit > 1e-9) {
            metrics.profit_factor = std::numeric_limits<double>::infinity();
        } else {
            metrics.profit_factor = 0.0;
        }

        metrics.avg_win_pnl = (metrics.winning_trades > 0) ? gross_profit / metrics.winning_trades : 0.0;
        metrics.avg_loss_pnl = (metrics.losing_trades > 0) ? gross_loss / metrics.losing_trades : 0.0; // Negative

        return metrics;
    }

    SubmissionScore scoreSubmission(const PerformanceMetrics& metrics, const core::ScoringConfig& scoring) {
        SubmissionScore score;
        score.profitability = std::min(45.0, std::max(0.0, metrics.total_return_pct * 2.25));
        score.sharpe = std::min(35.0, std::max(0.0, metrics.sharpe_ratio * 17.5));
        // 0% drawdown = 20 points, 20% or worse = 0 points
        score.drawdown = std::max(0.0, 20.0 - metrics.max_drawdown_pct);
        score.total = score.profitability + score.sharpe + score.drawdown;
        score.qualifies = score.profitability >= scoring.min_profitability &&
                          score.sharpe >= scoring.min_sharpe &&
                          score.drawdown >= scoring.min_drawdown &&
                          score.total >= scoring.min_total;
        return score;
    }

    void SubmissionScore::logScore() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Submission Score ---");
        logger->info("Profitability: {:.1f}/45", profitability);
        logger->info("Sharpe: {:.1f}/35", sharpe);
        logger->info("Drawdown: {:.1f}/20", drawdown);
        logger->info("Total: {:.1f}/100", total);
        if (qualifies) {
            logger->info("Submission qualifies.");
        } else {
            logger->warn("Submission does not meet the minimum score requirements.");
        }
        logger->info("------------------------");
    }

    core::json toJson(const PerformanceMetrics& metrics, const SubmissionScore& score) {
        core::json out;
        out["metrics"] = {
            {"initial_value", metrics.initial_value},
            {"final_value", metrics.final_value},
            {"total_return_pct", metrics.total_return_pct},
            {"total_pnl", metrics.total_pnl},
            {"total_fees", metrics.total_fees},
            {"max_drawdown_pct", metrics.max_drawdown_pct},
            {"sharpe_ratio", metrics.sharpe_ratio},
            {"total_executions", metrics.total_executions},
            {"buy_count", metrics.buy_count},
            {"sell_count", metrics.sell_count},
            {"round_trip_trades", metrics.round_trip_trades},
            {"winning_trades", metrics.winning_trades},
            {"losing_trades", metrics.losing_trades},
            {"win_rate", metrics.win_rate},
            {"avg_win_pnl", metrics.avg_win_pnl},
            {"avg_loss_pnl", metrics.avg_loss_pnl},
            {"rejected_signals", metrics.rejected_signals}
        };
        // JSON has no infinity: a run without losing trades reports null
        if (std::isfinite(metrics.profit_factor)) {
            out["metrics"]["profit_factor"] = metrics.profit_factor;
        } else {
            out["metrics"]["profit_factor"] = nullptr;
        }
        out["score"] = {
            {"profitability", score.profitability},
            {"sharpe", score.sharpe},
            {"drawdown", score.drawdown},
            {"total", score.total},
            {"qualifies", score.qualifies}
        };
        return out;
    }

} // namespace metrics
