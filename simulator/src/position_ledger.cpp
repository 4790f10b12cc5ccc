#include "position_ledger.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace simulator {

    PositionLedger::PositionLedger(double initial_cash)
        : initial_cash_(initial_cash), cash_(initial_cash) {
        if (!std::isfinite(initial_cash) || initial_cash < 0.0) {
            throw core::ConfigException(fmt::format("Initial cash must be a non-negative finite number (got {}).", initial_cash));
        }
    }

    double PositionLedger::getCash() const {
        return cash_;
    }

    bool PositionLedger::hasOpenPosition(const std::string& symbol) const {
        auto it = positions_.find(symbol);
        return it != positions_.end() && it->second.shares > 0.0;
    }

    const core::Position* PositionLedger::findPosition(const std::string& symbol) const {
        auto it = positions_.find(symbol);
        return (it != positions_.end()) ? &it->second : nullptr;
    }

    const std::map<std::string, core::Position>& PositionLedger::getPositions() const {
        return positions_;
    }

    std::optional<double> PositionLedger::getLastPrice(const std::string& symbol) const {
        auto it = last_prices_.find(symbol);
        if (it == last_prices_.end()) return std::nullopt;
        return it->second;
    }

    // Held shares at the last marked price; a position never marked contributes zero
    double PositionLedger::getPositionValue(const std::string& symbol) const {
        auto pos_it = positions_.find(symbol);
        if (pos_it == positions_.end()) return 0.0;
        auto price_it = last_prices_.find(symbol);
        if (price_it == last_prices_.end()) {
            core::logging::getLogger()->warn("No price marked for held position {}; valuing it at zero.", symbol);
            return 0.0;
        }
        return pos_it->second.shares * price_it->second;
    }

    double PositionLedger::getPositionsValue() const {
        double total_position_value = 0.0;
        for (const auto& pair : positions_) {
            total_position_value += getPositionValue(pair.first);
        }
        return total_position_value;
    }

    double PositionLedger::getPortfolioValue() const {
        return cash_ + getPositionsValue();
    }

    void PositionLedger::applyBuy(const std::string& symbol, double shares, double price, double total_cost,
                                  core::Timestamp timestamp) {
        core::Position& position = positions_[symbol];
        if (position.shares > 0.0) {
            double total_shares = position.shares + shares;
            position.average_cost_basis =
                (position.shares * position.average_cost_basis + shares * price) / total_shares;
            position.shares = total_shares;
        } else {
            position.symbol = symbol;
            position.shares = shares;
            position.average_cost_basis = price;
            position.opened_at = timestamp;
        }
        position.last_update_time = timestamp;
        cash_ -= total_cost;

        core::logging::getLogger()->debug("Ledger BUY {}: +{} shares @ {}, avg cost {}, cash {:.2f}",
                                          symbol, shares, price, position.average_cost_basis, cash_);
    }

    void PositionLedger::applySell(const std::string& symbol, double shares, double net_proceeds,
                                   core::Timestamp timestamp) {
        auto it = positions_.find(symbol);
        if (it == positions_.end()) {
            throw core::SimulationException("Cannot apply sell for " + symbol + ": no open position.");
        }
        it->second.shares -= shares;
        it->second.last_update_time = timestamp;
        cash_ += net_proceeds;

        auto logger = core::logging::getLogger();
        if (it->second.shares <= 0.0) {
            logger->debug("Ledger SELL {}: position closed at {}, cash {:.2f}",
                          symbol, core::utils::timestampToString(timestamp), cash_);
            positions_.erase(it);
        } else {
            logger->debug("Ledger SELL {}: -{} shares, {} remaining, cash {:.2f}",
                          symbol, shares, it->second.shares, cash_);
        }
    }

    void PositionLedger::markPrice(const std::string& symbol, double price) {
        last_prices_[symbol] = price;
    }

} // namespace simulator
