#pragma once

#include <string>
#include <variant>

#include "datatypes.hpp"
#include "position_ledger.hpp"

namespace simulator {

    // Why a signal did not turn into a trade
    enum class RejectionReason {
        // Price lookup (raised by the resolver, recorded by the driver)
        PriceNotFound,
        InvalidPrice,
        NegativePrice,
        // BUY
        ZeroPositionSize,
        NoCashAvailable,
        InvalidAllocation,
        FeesExceedAllocation,
        InvalidShareCount, // also SELL
        InsufficientFunds,
        ZeroTotalShares,
        // SELL
        NoPosition,
        InvalidGrossProceeds,
        FeesExceedProceeds,
        ZeroCostBasis
    };

    std::string toString(RejectionReason reason);

    struct Rejection {
        RejectionReason reason;
        std::string message;
    };

    // Outcome of one execution attempt: either the trade that was applied or the reason it was not
    class ExecutionResult {
    public:
        static ExecutionResult executed(core::TradeLogEntry entry);
        static ExecutionResult rejected(RejectionReason reason, std::string message);

        bool isExecuted() const;
        // Throw core::SimulationException when called on the wrong kind of result
        const core::TradeLogEntry& getEntry() const;
        const Rejection& getRejection() const;

    private:
        explicit ExecutionResult(std::variant<core::TradeLogEntry, Rejection> outcome);
        std::variant<core::TradeLogEntry, Rejection> outcome_;
    };

    // Sizes and applies BUY/SELL signals against a ledger at a given price.
    // A rejected signal leaves the ledger untouched.
    class TradeExecutor {
    public:
        explicit TradeExecutor(double fee_rate);

        // Throws core::SimulationException for HOLD signals
        ExecutionResult execute(const core::Signal& signal, PositionLedger& ledger, double price) const;

        double getFeeRate() const { return fee_rate_; }

    private:
        double fee_rate_;

        ExecutionResult executeBuy(const core::Signal& signal, PositionLedger& ledger, double price) const;
        ExecutionResult executeSell(const core::Signal& signal, PositionLedger& ledger, double price) const;
    };

} // namespace simulator
