#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <fstream>
#include <string>

namespace core {

    namespace { // File-local helpers for reading optional, typed keys

        double readNumber(const json& section, const char* key, double default_value, const char* section_name) {
            if (!section.contains(key)) return default_value;
            if (!section[key].is_number()) {
                throw ConfigException(fmt::format("'{}.{}' must be a number.", section_name, key));
            }
            return section[key].get<double>();
        }

        bool readBool(const json& section, const char* key, bool default_value, const char* section_name) {
            if (!section.contains(key)) return default_value;
            if (!section[key].is_boolean()) {
                throw ConfigException(fmt::format("'{}.{}' must be a boolean.", section_name, key));
            }
            return section[key].get<bool>();
        }

        // Whole numbers only, within [0, max_value]
        long long readCount(const json& section, const char* key, long long default_value, long long max_value,
                            const char* section_name) {
            if (!section.contains(key)) return default_value;
            const json& value = section[key];
            if (!value.is_number_integer()) {
                throw ConfigException(fmt::format("'{}.{}' must be a non-negative integer.", section_name, key));
            }
            if (value.is_number_unsigned()) {
                const auto count = value.get<std::uint64_t>();
                if (count > static_cast<std::uint64_t>(max_value)) {
                    throw ConfigException(fmt::format("'{}.{}' must not exceed {}.", section_name, key, max_value));
                }
                return static_cast<long long>(count);
            }
            const auto count = value.get<long long>();
            if (count < 0) {
                throw ConfigException(fmt::format("'{}.{}' must be a non-negative integer.", section_name, key));
            }
            if (count > max_value) {
                throw ConfigException(fmt::format("'{}.{}' must not exceed {}.", section_name, key, max_value));
            }
            return count;
        }

        std::string readString(const json& section, const char* key, const std::string& default_value, const char* section_name) {
            if (!section.contains(key)) return default_value;
            if (!section[key].is_string()) {
                throw ConfigException(fmt::format("'{}.{}' must be a string.", section_name, key));
            }
            return section[key].get<std::string>();
        }

        const json& readSection(const json& root, const char* name) {
            static const json empty_object = json::object();
            if (!root.contains(name)) return empty_object;
            if (!root[name].is_object()) {
                throw ConfigException(fmt::format("'{}' must be an object.", name));
            }
            return root[name];
        }

        std::vector<UniverseEntry> parseUniverseList(const json& universe, const char* key) {
            std::vector<UniverseEntry> entries;
            if (!universe.contains(key)) return entries;
            if (!universe[key].is_array()) {
                throw ConfigException(fmt::format("'universe.{}' must be an array.", key));
            }
            for (const auto& item : universe[key]) {
                if (!item.is_object() || !item.contains("symbol") || !item["symbol"].is_string() ||
                    !item.contains("timeframe") || !item["timeframe"].is_string()) {
                    throw ConfigException(fmt::format(
                        "Each 'universe.{}' entry requires 'symbol' (string) and 'timeframe' (string).", key));
                }
                UniverseEntry entry;
                entry.symbol = item["symbol"].get<std::string>();
                entry.timeframe = item["timeframe"].get<std::string>();
                entries.push_back(entry);
            }
            return entries;
        }

        SimulationConfig parseSimulation(const json& section) {
            SimulationConfig config;
            config.initial_cash = readNumber(section, "initial_cash", config.initial_cash, "simulation");
            config.fee_rate = readNumber(section, "fee_rate", config.fee_rate, "simulation");

            PriceResolutionConfig& pricing = config.pricing;
            pricing.price_field = priceFieldFromString(
                readString(section, "price_field", toString(pricing.price_field), "simulation"));
            pricing.primary_timeframe = readString(section, "primary_timeframe", pricing.primary_timeframe, "simulation");
            pricing.allow_prior_fallback = readBool(section, "allow_prior_fallback", pricing.allow_prior_fallback, "simulation");

            pricing.max_prior_staleness = std::chrono::seconds(readCount(
                section, "max_prior_staleness_seconds", pricing.max_prior_staleness.count(),
                std::chrono::duration_cast<std::chrono::seconds>(Timestamp::duration::max()).count(), "simulation"));

            if (section.contains("fallback_timeframes")) {
                const json& fallbacks = section["fallback_timeframes"];
                if (!fallbacks.is_array()) {
                    throw ConfigException("'simulation.fallback_timeframes' must be an array of strings.");
                }
                for (const auto& tf : fallbacks) {
                    if (!tf.is_string()) {
                        throw ConfigException("'simulation.fallback_timeframes' must be an array of strings.");
                    }
                    pricing.fallback_timeframes.push_back(tf.get<std::string>());
                }
            }
            return config;
        }

    } // end anonymous namespace

    PriceField priceFieldFromString(const std::string& field_str) {
        const std::string lower_str = utils::toLower(field_str);
        if (lower_str == "open") return PriceField::Open;
        if (lower_str == "high") return PriceField::High;
        if (lower_str == "low") return PriceField::Low;
        if (lower_str == "close") return PriceField::Close;
        throw ConfigException("Unknown price field: " + field_str);
    }

    void validateSimulationConfig(const SimulationConfig& config) {
        if (!std::isfinite(config.initial_cash) || config.initial_cash <= 0.0) {
            throw ConfigException(fmt::format("Initial cash must be a positive finite number (got {}).", config.initial_cash));
        }
        if (!std::isfinite(config.fee_rate) || config.fee_rate < 0.0 || config.fee_rate > 1.0) {
            throw ConfigException(fmt::format("Fee rate must be within [0, 1] (got {}).", config.fee_rate));
        }

        validatePriceResolutionConfig(config.pricing);
    }

    void validatePriceResolutionConfig(const PriceResolutionConfig& pricing) {
        const auto primary = utils::timeframeDuration(pricing.primary_timeframe);
        if (!primary) {
            throw ConfigException("Unknown primary timeframe: " + pricing.primary_timeframe);
        }
        for (const auto& tf : pricing.fallback_timeframes) {
            const auto duration = utils::timeframeDuration(tf);
            if (!duration) {
                throw ConfigException("Unknown fallback timeframe: " + tf);
            }
            if (*duration <= *primary) {
                throw ConfigException(fmt::format("Fallback timeframe '{}' must be coarser than primary timeframe '{}'.",
                                                  tf, pricing.primary_timeframe));
            }
        }
        if (pricing.max_prior_staleness.count() < 0) {
            throw ConfigException("Maximum prior-candle staleness must not be negative.");
        }
    }

    AppConfig configFromJson(const json& root) {
        if (!root.is_object()) {
            throw ConfigException("Configuration root must be a JSON object.");
        }

        AppConfig config;
        config.simulation = parseSimulation(readSection(root, "simulation"));
        validateSimulationConfig(config.simulation);

        const json& universe = readSection(root, "universe");
        config.universe.targets = parseUniverseList(universe, "targets");
        config.universe.anchors = parseUniverseList(universe, "anchors");

        const json& validation = readSection(root, "validation");
        config.validation.min_trade_pairs = static_cast<int>(readCount(
            validation, "min_trade_pairs", config.validation.min_trade_pairs, std::numeric_limits<int>::max(),
            "validation"));

        const json& metrics = readSection(root, "metrics");
        config.metrics.periods_per_year = readNumber(metrics, "periods_per_year", config.metrics.periods_per_year, "metrics");
        if (!std::isfinite(config.metrics.periods_per_year) || config.metrics.periods_per_year <= 0) {
            throw ConfigException("'metrics.periods_per_year' must be positive.");
        }

        const json& scoring = readSection(root, "scoring");
        config.scoring.min_profitability = readNumber(scoring, "min_profitability", config.scoring.min_profitability, "scoring");
        config.scoring.min_sharpe = readNumber(scoring, "min_sharpe", config.scoring.min_sharpe, "scoring");
        config.scoring.min_drawdown = readNumber(scoring, "min_drawdown", config.scoring.min_drawdown, "scoring");
        config.scoring.min_total = readNumber(scoring, "min_total", config.scoring.min_total, "scoring");

        return config;
    }

    AppConfig loadConfigFile(const std::string& path) {
        auto logger = logging::getLogger();
        logger->info("Loading configuration from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open config file: {}", path));
        }

        json root;
        try {
            root = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }

        AppConfig config = configFromJson(root);
        logger->info("Configuration loaded: cash={:.2f}, fee_rate={}, primary timeframe={}, {} fallback timeframe(s)",
                     config.simulation.initial_cash, config.simulation.fee_rate,
                     config.simulation.pricing.primary_timeframe,
                     config.simulation.pricing.fallback_timeframes.size());
        return config;
    }

} // namespace core
