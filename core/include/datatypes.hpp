#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <cstddef>
#include <limits>

namespace core {

    // Using system_clock for time points, all values are UTC
    using Timestamp = std::chrono::system_clock::time_point;

    enum class SignalType {
        Buy,
        Sell,
        Hold
    };

    enum class TradeAction {
        Buy,
        Sell
    };

    // Which candle field the price resolver reads
    enum class PriceField {
        Open,
        High,
        Low,
        Close
    };

    struct Candle {
        Timestamp timestamp;
        std::string symbol;
        std::string timeframe; // e.g. "1H", "4H", "1D"
        double open = std::numeric_limits<double>::quiet_NaN();
        double high = std::numeric_limits<double>::quiet_NaN();
        double low = std::numeric_limits<double>::quiet_NaN();
        double close = std::numeric_limits<double>::quiet_NaN();
        double volume = 0.0; // Crypto volumes are fractional

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }

        double field(PriceField f) const {
            switch (f) {
                case PriceField::Open: return open;
                case PriceField::High: return high;
                case PriceField::Low: return low;
                case PriceField::Close: return close;
            }
            return close;
        }
    };

    struct Signal {
        Timestamp timestamp;
        std::string symbol;
        SignalType signal = SignalType::Hold;
        double position_size = 0.0; // Fraction of cash (BUY) or held shares (SELL)
    };

    struct Position {
        std::string symbol;
        double shares = 0.0;
        double average_cost_basis = 0.0;
        Timestamp opened_at;
        Timestamp last_update_time;
    };

    // One executed trade. SELL entries also carry the realized result.
    struct TradeLogEntry {
        Timestamp timestamp;
        TradeAction action = TradeAction::Buy;
        std::string symbol;
        double shares = 0.0;
        double price = 0.0;
        double fees = 0.0;
        double cash_after = 0.0;
        double portfolio_value_after = 0.0;
        double cost_basis = 0.0;          // Average cost basis after a BUY, at sale for a SELL
        double realized_pnl = 0.0;        // SELL only: net proceeds minus cost of shares sold
        double realized_return_pct = 0.0; // SELL only: (price - cost_basis) / cost_basis
        bool closed_position = false;     // SELL only: position fully closed by this trade
    };

    // Portfolio state at one processed timestamp (one point of the equity curve)
    struct PortfolioState {
        Timestamp timestamp;
        double cash = 0.0;
        double positions_value = 0.0; // Market value of all holdings
        double total_equity = 0.0;    // cash + positions_value
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    std::string toString(SignalType type);
    std::string toString(TradeAction action);
    std::string toString(PriceField field);

} // namespace core
