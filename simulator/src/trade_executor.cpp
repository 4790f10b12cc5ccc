#include "trade_executor.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace simulator {

    namespace {

        std::string describe(const core::Signal& signal) {
            return fmt::format("{} {} at {}", core::toString(signal.signal), signal.symbol,
                               core::utils::timestampToString(signal.timestamp));
        }

        ExecutionResult reject(const core::Signal& signal, RejectionReason reason, const std::string& detail) {
            return ExecutionResult::rejected(reason, fmt::format("{} rejected: {}", describe(signal), detail));
        }

        // Cost overshooting cash by no more than this is floating point noise from shares * price
        double roundingTolerance(double cash) {
            return 1e-9 * std::max(1.0, cash);
        }

    } // end anonymous namespace

    std::string toString(RejectionReason reason) {
        switch (reason) {
            case RejectionReason::PriceNotFound: return "PriceNotFound";
            case RejectionReason::InvalidPrice: return "InvalidPrice";
            case RejectionReason::NegativePrice: return "NegativePrice";
            case RejectionReason::ZeroPositionSize: return "ZeroPositionSize";
            case RejectionReason::NoCashAvailable: return "NoCashAvailable";
            case RejectionReason::InvalidAllocation: return "InvalidAllocation";
            case RejectionReason::FeesExceedAllocation: return "FeesExceedAllocation";
            case RejectionReason::InvalidShareCount: return "InvalidShareCount";
            case RejectionReason::InsufficientFunds: return "InsufficientFunds";
            case RejectionReason::ZeroTotalShares: return "ZeroTotalShares";
            case RejectionReason::NoPosition: return "NoPosition";
            case RejectionReason::InvalidGrossProceeds: return "InvalidGrossProceeds";
            case RejectionReason::FeesExceedProceeds: return "FeesExceedProceeds";
            case RejectionReason::ZeroCostBasis: return "ZeroCostBasis";
        }
        return "Unknown";
    }

    // --- ExecutionResult ---

    ExecutionResult::ExecutionResult(std::variant<core::TradeLogEntry, Rejection> outcome)
        : outcome_(std::move(outcome)) {}

    ExecutionResult ExecutionResult::executed(core::TradeLogEntry entry) {
        return ExecutionResult(std::move(entry));
    }

    ExecutionResult ExecutionResult::rejected(RejectionReason reason, std::string message) {
        return ExecutionResult(Rejection{reason, std::move(message)});
    }

    bool ExecutionResult::isExecuted() const {
        return std::holds_alternative<core::TradeLogEntry>(outcome_);
    }

    const core::TradeLogEntry& ExecutionResult::getEntry() const {
        if (!isExecuted()) {
            throw core::SimulationException("Execution result holds a rejection, not a trade.");
        }
        return std::get<core::TradeLogEntry>(outcome_);
    }

    const Rejection& ExecutionResult::getRejection() const {
        if (isExecuted()) {
            throw core::SimulationException("Execution result holds a trade, not a rejection.");
        }
        return std::get<Rejection>(outcome_);
    }

    // --- TradeExecutor ---

    TradeExecutor::TradeExecutor(double fee_rate) : fee_rate_(fee_rate) {
        if (!std::isfinite(fee_rate) || fee_rate < 0.0 || fee_rate > 1.0) {
            throw core::ConfigException(fmt::format("Fee rate must be within [0, 1] (got {}).", fee_rate));
        }
    }

    ExecutionResult TradeExecutor::execute(const core::Signal& signal, PositionLedger& ledger, double price) const {
        switch (signal.signal) {
            case core::SignalType::Buy:
                return executeBuy(signal, ledger, price);
            case core::SignalType::Sell:
                return executeSell(signal, ledger, price);
            case core::SignalType::Hold:
                break;
        }
        throw core::SimulationException(fmt::format("HOLD signal for {} at {} cannot be executed.",
                                                    signal.symbol, core::utils::timestampToString(signal.timestamp)));
    }

    ExecutionResult TradeExecutor::executeBuy(const core::Signal& signal, PositionLedger& ledger, double price) const {
        const double cash = ledger.getCash();

        if (signal.position_size == 0.0) {
            return reject(signal, RejectionReason::ZeroPositionSize, "position size is zero");
        }
        if (cash <= 0.0) {
            return reject(signal, RejectionReason::NoCashAvailable, "no cash available");
        }

        const double allocated = cash * signal.position_size;
        if (!(allocated > 0.0)) {
            return reject(signal, RejectionReason::InvalidAllocation,
                          fmt::format("allocated cash is zero or negative ({:.5f})", allocated));
        }

        const double fees = allocated * fee_rate_;
        const double target = allocated - fees;
        if (!(target > 0.0)) {
            return reject(signal, RejectionReason::FeesExceedAllocation,
                          fmt::format("target amount after fees is zero or negative ({:.5f})", target));
        }

        if (!std::isfinite(price)) {
            return reject(signal, RejectionReason::InvalidPrice, "price is NaN or infinite");
        }
        if (price < 0.0) {
            return reject(signal, RejectionReason::NegativePrice, fmt::format("price is negative ({})", price));
        }

        // A zero price yields an infinite share count and lands here
        const double shares = target / price;
        if (!std::isfinite(shares) || shares <= 0.0) {
            return reject(signal, RejectionReason::InvalidShareCount,
                          fmt::format("computed share count is invalid ({})", shares));
        }

        double total_cost = shares * price + fees;
        if (total_cost > cash) {
            if (total_cost - cash > roundingTolerance(cash)) {
                return reject(signal, RejectionReason::InsufficientFunds,
                              fmt::format("insufficient funds: required {:.5f}, available {:.5f}", total_cost, cash));
            }
            total_cost = cash;
        }

        const core::Position* existing = ledger.findPosition(signal.symbol);
        const double old_shares = existing ? existing->shares : 0.0;
        if (old_shares + shares == 0.0) {
            return reject(signal, RejectionReason::ZeroTotalShares, "total shares after purchase would be zero");
        }

        ledger.applyBuy(signal.symbol, shares, price, total_cost, signal.timestamp);
        ledger.markPrice(signal.symbol, price);

        core::TradeLogEntry entry;
        entry.timestamp = signal.timestamp;
        entry.action = core::TradeAction::Buy;
        entry.symbol = signal.symbol;
        entry.shares = shares;
        entry.price = price;
        entry.fees = fees;
        entry.cash_after = ledger.getCash();
        entry.portfolio_value_after = ledger.getPortfolioValue();
        entry.cost_basis = ledger.findPosition(signal.symbol)->average_cost_basis;

        core::logging::getLogger()->info("Trade Executed: Time={}, Sym={}, Action=BUY, Shares={}, Price={}, Fees={:.5f}, NewCash={:.2f}",
                                         core::utils::timestampToString(entry.timestamp), entry.symbol,
                                         entry.shares, entry.price, entry.fees, entry.cash_after);
        return ExecutionResult::executed(std::move(entry));
    }

    ExecutionResult TradeExecutor::executeSell(const core::Signal& signal, PositionLedger& ledger, double price) const {
        const core::Position* position = ledger.findPosition(signal.symbol);
        if (!position || position->shares <= 0.0) {
            return reject(signal, RejectionReason::NoPosition, "no position found");
        }

        if (!std::isfinite(price)) {
            return reject(signal, RejectionReason::InvalidPrice, "price is NaN or infinite");
        }
        if (price < 0.0) {
            return reject(signal, RejectionReason::NegativePrice, fmt::format("price is negative ({})", price));
        }

        const double held_shares = position->shares;
        const double cost_basis = position->average_cost_basis;

        const double shares_to_sell = held_shares * signal.position_size;
        if (!std::isfinite(shares_to_sell) || shares_to_sell <= 0.0) {
            return reject(signal, RejectionReason::InvalidShareCount,
                          fmt::format("shares to sell is zero or negative ({})", shares_to_sell));
        }

        const double gross = shares_to_sell * price;
        if (!(gross > 0.0)) {
            return reject(signal, RejectionReason::InvalidGrossProceeds,
                          fmt::format("gross proceeds are zero or negative ({:.5f})", gross));
        }

        const double fees = gross * fee_rate_;
        const double net = gross * (1.0 - fee_rate_);
        if (!(net > 0.0)) {
            return reject(signal, RejectionReason::FeesExceedProceeds,
                          fmt::format("net proceeds after fees are zero or negative ({:.5f})", net));
        }

        if (cost_basis == 0.0) {
            return reject(signal, RejectionReason::ZeroCostBasis, "position has a zero cost basis");
        }

        const double realized_pnl = net - shares_to_sell * cost_basis;
        const double realized_return = (price - cost_basis) / cost_basis;
        const bool closes = held_shares - shares_to_sell <= 0.0;

        ledger.applySell(signal.symbol, shares_to_sell, net, signal.timestamp);
        ledger.markPrice(signal.symbol, price);

        core::TradeLogEntry entry;
        entry.timestamp = signal.timestamp;
        entry.action = core::TradeAction::Sell;
        entry.symbol = signal.symbol;
        entry.shares = shares_to_sell;
        entry.price = price;
        entry.fees = fees;
        entry.cash_after = ledger.getCash();
        entry.portfolio_value_after = ledger.getPortfolioValue();
        entry.cost_basis = cost_basis;
        entry.realized_pnl = realized_pnl;
        entry.realized_return_pct = realized_return;
        entry.closed_position = closes;

        core::logging::getLogger()->info("Trade Executed: Time={}, Sym={}, Action=SELL, Shares={}, Price={}, Fees={:.5f}, PnL={:.2f}, NewCash={:.2f}",
                                         core::utils::timestampToString(entry.timestamp), entry.symbol,
                                         entry.shares, entry.price, entry.fees, entry.realized_pnl, entry.cash_after);
        return ExecutionResult::executed(std::move(entry));
    }

} // namespace simulator
