#include "simulation_driver.hpp"
#include "dataset_validator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace simulator {

    SimulationDriver::SimulationDriver(core::SimulationConfig config, const PriceResolver& resolver)
        : config_(std::move(config)), resolver_(resolver), executor_(config_.fee_rate)
    {
        core::validateSimulationConfig(config_);
        core::logging::getLogger()->debug("SimulationDriver initialized with cash: {}, fee rate: {}",
                                          config_.initial_cash, config_.fee_rate);
    }

    SimulationResult SimulationDriver::simulate(const std::vector<core::Signal>& signals) const {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Simulation Run");
        logger->info("========================================================");
        logger->info("Signals: {}, Initial Cash: {:.2f}, Fee Rate: {}", signals.size(), config_.initial_cash, config_.fee_rate);

        // Timestamp order, ties keep input order
        std::vector<core::Signal> ordered(signals);
        std::stable_sort(ordered.begin(), ordered.end(), [](const core::Signal& a, const core::Signal& b) {
            return a.timestamp < b.timestamp;
        });

        PositionLedger ledger(config_.initial_cash);
        SimulationResult result;
        result.initial_cash = config_.initial_cash;

        for (const auto& signal : ordered) {
            // Holdings are valued at this timestamp before the trade records portfolio_value
            refreshMarks(signal, ledger);
            processSignal(signal, ledger, result);
            recordPortfolioValue(signal.timestamp, ledger, result.equity_curve);
        }

        result.final_cash = ledger.getCash();
        result.final_portfolio_value = ledger.getPortfolioValue();

        if (result.trade_log.empty()) {
            logger->warn("Simulation produced no trades ({} signals processed, {} rejected, {} HOLD).",
                         result.signals_processed, result.rejections.size(), result.hold_signals);
        }

        data::DatasetValidator::validateTradeLog(result.trade_log);

        logger->info("========================================================");
        logger->info("Simulation Completed: {} trades, {} rejections, final value {:.2f}",
                     result.trade_log.size(), result.rejections.size(), result.final_portfolio_value);
        logger->info("========================================================");
        return result;
    }

    void SimulationDriver::processSignal(const core::Signal& signal, PositionLedger& ledger,
                                         SimulationResult& result) const {
        auto logger = core::logging::getLogger();
        ++result.signals_processed;

        if (signal.signal == core::SignalType::Hold) {
            ++result.hold_signals;
            logger->trace("HOLD {} at {}", signal.symbol, core::utils::timestampToString(signal.timestamp));
            return;
        }

        auto record = [&](RejectionReason reason, const std::string& message) {
            logger->warn("{} ({})", message, toString(reason));
            result.rejections.push_back({signal.timestamp, signal.symbol, signal.signal, reason, message});
        };

        double price = 0.0;
        try {
            price = resolver_.resolve(signal.symbol, signal.timestamp);
        } catch (const core::PriceNotFoundException& e) {
            record(RejectionReason::PriceNotFound, e.what());
            return;
        } catch (const core::InvalidPriceException& e) {
            record(RejectionReason::InvalidPrice, e.what());
            return;
        } catch (const core::NegativePriceException& e) {
            record(RejectionReason::NegativePrice, e.what());
            return;
        }

        ledger.markPrice(signal.symbol, price);
        ExecutionResult outcome = executor_.execute(signal, ledger, price);
        if (outcome.isExecuted()) {
            result.trade_log.push_back(outcome.getEntry());
        } else {
            const Rejection& rejection = outcome.getRejection();
            record(rejection.reason, rejection.message);
        }
    }

    // Keeps valuations current; a symbol without a usable price keeps its last mark
    void SimulationDriver::refreshMarks(const core::Signal& signal, PositionLedger& ledger) const {
        auto logger = core::logging::getLogger();
        std::set<std::string> symbols{signal.symbol};
        for (const auto& pair : ledger.getPositions()) {
            symbols.insert(pair.first);
        }
        for (const auto& symbol : symbols) {
            try {
                ledger.markPrice(symbol, resolver_.resolve(symbol, signal.timestamp));
            } catch (const core::PriceResolutionException& e) {
                logger->trace("Mark not refreshed for {}: {}", symbol, e.what());
            }
        }
    }

    // A later signal at the same timestamp replaces the point
    void SimulationDriver::recordPortfolioValue(core::Timestamp timestamp, const PositionLedger& ledger,
                                                std::vector<core::PortfolioState>& equity_curve) const {
        core::PortfolioState current_state;
        current_state.timestamp = timestamp;
        current_state.cash = ledger.getCash();
        current_state.positions_value = ledger.getPositionsValue();
        current_state.total_equity = current_state.cash + current_state.positions_value;

        if (!equity_curve.empty() && equity_curve.back().timestamp == timestamp) {
            equity_curve.back() = current_state;
        } else {
            equity_curve.push_back(current_state);
        }
    }

    SimulationResult simulate(const std::vector<core::Signal>& signals,
                              const core::TimeSeries<core::Candle>& candles,
                              const core::SimulationConfig& config) {
        PriceResolver resolver(candles, config.pricing);
        SimulationDriver driver(config, resolver);
        return driver.simulate(signals);
    }

} // namespace simulator
