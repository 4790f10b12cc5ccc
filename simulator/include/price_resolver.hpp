#pragma once

#include <map>
#include <string>
#include <vector>

#include "config.hpp"
#include "datatypes.hpp"

namespace simulator {

    // Where a resolved price came from
    struct PriceResolution {
        double price = 0.0;
        std::string timeframe;
        core::Timestamp candle_time;
        bool exact = true; // false when taken from the nearest prior candle
    };

    // Turns (symbol, timestamp) into an execution price using the candle store.
    // Lookup order: exact candle in the primary timeframe, exact candle in each fallback
    // timeframe, then (if enabled) the nearest prior candle across the same timeframes.
    class PriceResolver {
    public:
        // Throws core::ConfigException if the resolution settings are invalid
        PriceResolver(const core::TimeSeries<core::Candle>& candles, core::PriceResolutionConfig config);

        // Throws PriceNotFoundException, InvalidPriceException or NegativePriceException
        double resolve(const std::string& symbol, core::Timestamp timestamp) const;
        PriceResolution resolveDetailed(const std::string& symbol, core::Timestamp timestamp) const;

        bool hasSeries(const std::string& symbol) const;
        std::vector<std::string> getSymbols() const;
        std::size_t getCandleCount() const { return candle_count_; }
        const core::PriceResolutionConfig& getConfig() const { return config_; }

    private:
        struct PricePoint {
            core::Timestamp timestamp;
            double price = 0.0;
        };
        using Series = std::vector<PricePoint>; // sorted by timestamp, unique

        core::PriceResolutionConfig config_;
        std::vector<std::string> search_order_; // primary first, then fallbacks
        // symbol -> timeframe -> series
        std::map<std::string, std::map<std::string, Series>> series_;
        std::size_t candle_count_ = 0;

        const Series* findSeries(const std::string& symbol, const std::string& timeframe) const;
        PriceResolution validated(const std::string& symbol, core::Timestamp timestamp,
                                  PriceResolution resolution) const;
    };

} // namespace simulator
