#pragma once

#include <map>
#include <optional>
#include <string>

#include "datatypes.hpp"

namespace simulator {

    // Cash plus open long positions, valued at the last price marked for each symbol.
    // The ledger applies fills; the executor decides whether a fill is allowed.
    class PositionLedger {
    public:
        // Throws core::ConfigException for negative or non-finite cash
        explicit PositionLedger(double initial_cash);

        // --- Getters ---
        double getCash() const;
        double getInitialCash() const { return initial_cash_; }
        bool hasOpenPosition(const std::string& symbol) const;
        // nullptr when the symbol is not held
        const core::Position* findPosition(const std::string& symbol) const;
        const std::map<std::string, core::Position>& getPositions() const;

        std::optional<double> getLastPrice(const std::string& symbol) const;
        double getPositionValue(const std::string& symbol) const;
        double getPositionsValue() const;
        double getPortfolioValue() const;

        // --- Modifiers ---
        // Adds shares at price, re-averaging the cost basis; a reopened position starts a fresh lot
        void applyBuy(const std::string& symbol, double shares, double price, double total_cost,
                      core::Timestamp timestamp);
        // Removes shares and credits net proceeds; the position is dropped once no shares remain
        void applySell(const std::string& symbol, double shares, double net_proceeds,
                       core::Timestamp timestamp);
        void markPrice(const std::string& symbol, double price);

    private:
        double initial_cash_;
        double cash_;
        std::map<std::string, core::Position> positions_;
        std::map<std::string, double> last_prices_;
    };

} // namespace simulator
