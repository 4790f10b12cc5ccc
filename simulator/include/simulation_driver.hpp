#pragma once

#include <string>
#include <vector>

#include "config.hpp"
#include "datatypes.hpp"
#include "position_ledger.hpp"
#include "price_resolver.hpp"
#include "trade_executor.hpp"

namespace simulator {

    // A BUY/SELL signal that did not produce a trade
    struct RejectionRecord {
        core::Timestamp timestamp;
        std::string symbol;
        core::SignalType signal = core::SignalType::Hold;
        RejectionReason reason = RejectionReason::PriceNotFound;
        std::string message;
    };

    struct SimulationResult {
        std::vector<core::TradeLogEntry> trade_log;
        std::vector<core::PortfolioState> equity_curve; // one point per processed timestamp
        std::vector<RejectionRecord> rejections;
        double initial_cash = 0.0;
        double final_cash = 0.0;
        double final_portfolio_value = 0.0;
        std::size_t signals_processed = 0;
        std::size_t hold_signals = 0;
    };

    // Replays signals in timestamp order against a fresh ledger.
    // Per-signal failures become rejections; the run itself only fails on
    // programming errors or a trade log that fails its integrity check.
    class SimulationDriver {
    public:
        // The resolver must outlive the driver
        SimulationDriver(core::SimulationConfig config, const PriceResolver& resolver);

        SimulationResult simulate(const std::vector<core::Signal>& signals) const;

        const core::SimulationConfig& getConfig() const { return config_; }

    private:
        core::SimulationConfig config_;
        const PriceResolver& resolver_; // Not owned
        TradeExecutor executor_;

        void processSignal(const core::Signal& signal, PositionLedger& ledger, SimulationResult& result) const;
        void refreshMarks(const core::Signal& signal, PositionLedger& ledger) const;
        void recordPortfolioValue(core::Timestamp timestamp, const PositionLedger& ledger,
                                  std::vector<core::PortfolioState>& equity_curve) const;
    };

    // Builds a resolver over the candles and runs one simulation
    SimulationResult simulate(const std::vector<core::Signal>& signals,
                              const core::TimeSeries<core::Candle>& candles,
                              const core::SimulationConfig& config);

} // namespace simulator
