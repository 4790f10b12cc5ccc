#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace core {

    using json = nlohmann::json;

    // How the price resolver turns (symbol, timestamp) into a price
    struct PriceResolutionConfig {
        std::string primary_timeframe = "1H";
        // Tried in order after the primary; each must be coarser than the primary
        std::vector<std::string> fallback_timeframes;
        PriceField price_field = PriceField::Close;
        bool allow_prior_fallback = true;
        // 0 = no limit on the age of a prior candle
        std::chrono::seconds max_prior_staleness{0};
    };

    struct SimulationConfig {
        double initial_cash = 10000.0;
        double fee_rate = 0.001;
        PriceResolutionConfig pricing;
    };

    struct UniverseEntry {
        std::string symbol;
        std::string timeframe;
    };

    // Traded symbols (targets) and context-only symbols (anchors)
    struct UniverseConfig {
        std::vector<UniverseEntry> targets;
        std::vector<UniverseEntry> anchors;

        bool empty() const { return targets.empty() && anchors.empty(); }
    };

    struct ValidationConfig {
        int min_trade_pairs = 0; // 0 disables the check
    };

    struct MetricsConfig {
        double periods_per_year = 252.0;
    };

    struct ScoringConfig {
        double min_profitability = 9.0;
        double min_sharpe = 10.0;
        double min_drawdown = 5.0;
        double min_total = 50.0;
    };

    struct AppConfig {
        SimulationConfig simulation;
        UniverseConfig universe;
        ValidationConfig validation;
        MetricsConfig metrics;
        ScoringConfig scoring;
    };

    // Throws ConfigException on malformed or out-of-range values
    AppConfig configFromJson(const json& root);
    AppConfig loadConfigFile(const std::string& path);

    void validateSimulationConfig(const SimulationConfig& config);
    void validatePriceResolutionConfig(const PriceResolutionConfig& pricing);

    PriceField priceFieldFromString(const std::string& field_str);

} // namespace core
