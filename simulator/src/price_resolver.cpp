#include "price_resolver.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace simulator {

    PriceResolver::PriceResolver(const core::TimeSeries<core::Candle>& candles, core::PriceResolutionConfig config)
        : config_(std::move(config))
    {
        auto logger = core::logging::getLogger();
        core::validatePriceResolutionConfig(config_);

        search_order_.push_back(config_.primary_timeframe);
        for (const auto& tf : config_.fallback_timeframes) {
            search_order_.push_back(tf);
        }

        for (const auto& candle : candles) {
            series_[candle.symbol][candle.timeframe].push_back({candle.timestamp, candle.field(config_.price_field)});
        }

        // Sort each series; on duplicate timestamps the first candle in input order wins
        for (auto& symbol_pair : series_) {
            for (auto& tf_pair : symbol_pair.second) {
                Series& series = tf_pair.second;
                std::stable_sort(series.begin(), series.end(),
                                 [](const PricePoint& a, const PricePoint& b) { return a.timestamp < b.timestamp; });
                auto last = std::unique(series.begin(), series.end(),
                                        [](const PricePoint& a, const PricePoint& b) { return a.timestamp == b.timestamp; });
                std::size_t duplicates = static_cast<std::size_t>(std::distance(last, series.end()));
                if (duplicates > 0) {
                    logger->warn("Dropped {} duplicate candle(s) for {} ({}); keeping the first occurrence.",
                                 duplicates, symbol_pair.first, tf_pair.first);
                    series.erase(last, series.end());
                }
                candle_count_ += series.size();
            }
        }

        logger->debug("PriceResolver initialized: {} candles across {} symbols, search order [{}], prior fallback {}",
                      candle_count_, series_.size(), fmt::join(search_order_, ", "),
                      config_.allow_prior_fallback ? "enabled" : "disabled");
    }

    const PriceResolver::Series* PriceResolver::findSeries(const std::string& symbol, const std::string& timeframe) const {
        auto symbol_it = series_.find(symbol);
        if (symbol_it == series_.end()) return nullptr;
        auto tf_it = symbol_it->second.find(timeframe);
        if (tf_it == symbol_it->second.end() || tf_it->second.empty()) return nullptr;
        return &tf_it->second;
    }

    PriceResolution PriceResolver::validated(const std::string& symbol, core::Timestamp timestamp,
                                             PriceResolution resolution) const {
        if (!std::isfinite(resolution.price)) {
            throw core::InvalidPriceException(fmt::format(
                "Invalid price for {} at {}: {} candle at {} has a non-finite {} value",
                symbol, core::utils::timestampToString(timestamp), resolution.timeframe,
                core::utils::timestampToString(resolution.candle_time), core::toString(config_.price_field)));
        }
        if (resolution.price < 0.0) {
            throw core::NegativePriceException(fmt::format(
                "Negative price for {} at {}: {} candle at {} has {} = {}",
                symbol, core::utils::timestampToString(timestamp), resolution.timeframe,
                core::utils::timestampToString(resolution.candle_time), core::toString(config_.price_field),
                resolution.price));
        }
        return resolution;
    }

    PriceResolution PriceResolver::resolveDetailed(const std::string& symbol, core::Timestamp timestamp) const {
        auto logger = core::logging::getLogger();
        auto by_time = [](const PricePoint& point, core::Timestamp ts) { return point.timestamp < ts; };

        // 1 & 2. Exact match, primary timeframe first
        for (const auto& tf : search_order_) {
            const Series* series = findSeries(symbol, tf);
            if (!series) continue;
            auto it = std::lower_bound(series->begin(), series->end(), timestamp, by_time);
            if (it != series->end() && it->timestamp == timestamp) {
                if (tf != config_.primary_timeframe) {
                    logger->debug("Price for {} at {} resolved from fallback timeframe {}",
                                  symbol, core::utils::timestampToString(timestamp), tf);
                }
                return validated(symbol, timestamp, {it->price, tf, it->timestamp, true});
            }
        }

        // 3. Nearest prior candle
        if (config_.allow_prior_fallback) {
            for (const auto& tf : search_order_) {
                const Series* series = findSeries(symbol, tf);
                if (!series) continue;
                auto it = std::lower_bound(series->begin(), series->end(), timestamp, by_time);
                if (it == series->begin()) continue; // nothing strictly before
                --it;
                auto age = std::chrono::duration_cast<std::chrono::seconds>(timestamp - it->timestamp);
                if (config_.max_prior_staleness.count() > 0 && age > config_.max_prior_staleness) {
                    logger->trace("Prior {} candle for {} is {}s old, beyond the {}s limit",
                                  tf, symbol, age.count(), config_.max_prior_staleness.count());
                    continue;
                }
                logger->debug("Price for {} at {} resolved from prior {} candle at {}",
                              symbol, core::utils::timestampToString(timestamp), tf,
                              core::utils::timestampToString(it->timestamp));
                return validated(symbol, timestamp, {it->price, tf, it->timestamp, false});
            }
        }

        // 4. Nothing usable
        throw core::PriceNotFoundException(fmt::format(
            "No price found for {} at {} (timeframes tried: {}; prior fallback {})",
            symbol, core::utils::timestampToString(timestamp), fmt::join(search_order_, ", "),
            config_.allow_prior_fallback ? "enabled" : "disabled"));
    }

    double PriceResolver::resolve(const std::string& symbol, core::Timestamp timestamp) const {
        return resolveDetailed(symbol, timestamp).price;
    }

    bool PriceResolver::hasSeries(const std::string& symbol) const {
        return series_.find(symbol) != series_.end();
    }

    std::vector<std::string> PriceResolver::getSymbols() const {
        std::vector<std::string> symbols;
        symbols.reserve(series_.size());
        for (const auto& pair : series_) {
            symbols.push_back(pair.first);
        }
        return symbols;
    }

} // namespace simulator
