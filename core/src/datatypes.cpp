#include "datatypes.hpp"

namespace core {

    std::string toString(SignalType type) {
        switch (type) {
            case SignalType::Buy: return "BUY";
            case SignalType::Sell: return "SELL";
            case SignalType::Hold: return "HOLD";
        }
        return "UNKNOWN";
    }

    std::string toString(TradeAction action) {
        switch (action) {
            case TradeAction::Buy: return "BUY";
            case TradeAction::Sell: return "SELL";
        }
        return "UNKNOWN";
    }

    std::string toString(PriceField field) {
        switch (field) {
            case PriceField::Open: return "open";
            case PriceField::High: return "high";
            case PriceField::Low: return "low";
            case PriceField::Close: return "close";
        }
        return "unknown";
    }

} // namespace core
