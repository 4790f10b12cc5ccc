#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "config.hpp"
#include "exceptions.hpp"

TEST(ConfigTest, EmptyObjectYieldsDefaults) {
    core::AppConfig config = core::configFromJson(core::json::object());

    EXPECT_DOUBLE_EQ(config.simulation.initial_cash, 10000.0);
    EXPECT_DOUBLE_EQ(config.simulation.fee_rate, 0.001);
    EXPECT_EQ(config.simulation.pricing.primary_timeframe, "1H");
    EXPECT_TRUE(config.simulation.pricing.fallback_timeframes.empty());
    EXPECT_TRUE(config.simulation.pricing.allow_prior_fallback);
    EXPECT_EQ(config.simulation.pricing.price_field, core::PriceField::Close);
    EXPECT_TRUE(config.universe.empty());
    EXPECT_EQ(config.validation.min_trade_pairs, 0);
    EXPECT_DOUBLE_EQ(config.metrics.periods_per_year, 252.0);
    EXPECT_DOUBLE_EQ(config.scoring.min_total, 50.0);
}

TEST(ConfigTest, ParsesAllSections) {
    core::json root = core::json::parse(R"({
        "simulation": {
            "initial_cash": 1000,
            "fee_rate": 0.002,
            "price_field": "open",
            "primary_timeframe": "1H",
            "fallback_timeframes": ["4H", "1D"],
            "allow_prior_fallback": false,
            "max_prior_staleness_seconds": 7200
        },
        "universe": {
            "targets": [{"symbol": "LDO", "timeframe": "1H"}],
            "anchors": [{"symbol": "BTC", "timeframe": "4H"}]
        },
        "validation": {"min_trade_pairs": 2},
        "metrics": {"periods_per_year": 365},
        "scoring": {"min_total": 60}
    })");

    core::AppConfig config = core::configFromJson(root);

    EXPECT_DOUBLE_EQ(config.simulation.initial_cash, 1000.0);
    EXPECT_DOUBLE_EQ(config.simulation.fee_rate, 0.002);
    EXPECT_EQ(config.simulation.pricing.price_field, core::PriceField::Open);
    ASSERT_EQ(config.simulation.pricing.fallback_timeframes.size(), 2u);
    EXPECT_EQ(config.simulation.pricing.fallback_timeframes[1], "1D");
    EXPECT_FALSE(config.simulation.pricing.allow_prior_fallback);
    EXPECT_EQ(config.simulation.pricing.max_prior_staleness.count(), 7200);
    ASSERT_EQ(config.universe.targets.size(), 1u);
    EXPECT_EQ(config.universe.targets[0].symbol, "LDO");
    EXPECT_EQ(config.universe.anchors[0].timeframe, "4H");
    EXPECT_EQ(config.validation.min_trade_pairs, 2);
    EXPECT_DOUBLE_EQ(config.metrics.periods_per_year, 365.0);
    EXPECT_DOUBLE_EQ(config.scoring.min_total, 60.0);
    EXPECT_DOUBLE_EQ(config.scoring.min_sharpe, 10.0);
}

TEST(ConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"simulation": {"fee_rate": 1.5}})")), core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"simulation": {"fee_rate": -0.1}})")), core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"simulation": {"initial_cash": 0}})")), core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"validation": {"min_trade_pairs": -1}})")), core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"metrics": {"periods_per_year": 0}})")), core::ConfigException);
}

TEST(ConfigTest, CountsMustBeWholeNumbersInRange) {
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"validation": {"min_trade_pairs": 2.5}})")),
                 core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"validation": {"min_trade_pairs": 3e9}})")),
                 core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"validation": {"min_trade_pairs": 3000000000}})")),
                 core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"simulation": {"max_prior_staleness_seconds": 1.5}})")),
                 core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"simulation": {"max_prior_staleness_seconds": -60}})")),
                 core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(
                     R"({"simulation": {"max_prior_staleness_seconds": 18446744073709551615}})")),
                 core::ConfigException);

    auto config = core::configFromJson(core::json::parse(R"({"validation": {"min_trade_pairs": 2147483647}})"));
    EXPECT_EQ(config.validation.min_trade_pairs, 2147483647);
}

TEST(ConfigTest, RejectsWrongTypes) {
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"simulation": {"fee_rate": "low"}})")), core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"simulation": []})")), core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"universe": {"targets": [{"symbol": "LDO"}]}})")),
                 core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse("[]")), core::ConfigException);
}

TEST(ConfigTest, FallbackTimeframesMustBeCoarser) {
    EXPECT_THROW(core::configFromJson(core::json::parse(
                     R"({"simulation": {"primary_timeframe": "4H", "fallback_timeframes": ["1H"]}})")),
                 core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(
                     R"({"simulation": {"fallback_timeframes": ["1H"]}})")),
                 core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"simulation": {"primary_timeframe": "hourly"}})")),
                 core::ConfigException);
    EXPECT_THROW(core::configFromJson(core::json::parse(R"({"simulation": {"price_field": "mid"}})")),
                 core::ConfigException);
}

TEST(ConfigTest, LoadsConfigFile) {
    const auto path = std::filesystem::temp_directory_path() / "tradesim_config_test.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"simulation": {"initial_cash": 2500}})";
    }
    core::AppConfig config = core::loadConfigFile(path.string());
    EXPECT_DOUBLE_EQ(config.simulation.initial_cash, 2500.0);
    std::filesystem::remove(path);
}

TEST(ConfigTest, MissingOrMalformedFileThrows) {
    EXPECT_THROW(core::loadConfigFile("/nonexistent/tradesim.json"), core::ConfigException);

    const auto path = std::filesystem::temp_directory_path() / "tradesim_bad_config_test.json";
    {
        std::ofstream ofs(path);
        ofs << "{ not json";
    }
    EXPECT_THROW(core::loadConfigFile(path.string()), core::ConfigException);
    std::filesystem::remove(path);
}
