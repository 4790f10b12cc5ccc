#pragma once

#include <string>
#include <vector>
#include <cstddef>

#include "datatypes.hpp"
#include "config.hpp"
#include "table.hpp"

namespace data {

    // Boundary between loosely-typed tables and the engine's typed records.
    // Structural problems throw core::SchemaException before any simulation starts;
    // trade-log problems after a run throw core::IntegrityException.
    class DatasetValidator {
    public:
        // Maximum number of individual invalid values quoted in one error message
        static constexpr std::size_t kMaxReportedIssues = 10;

        // Timeframes a submission universe may use
        static const std::vector<std::string>& allowedUniverseTimeframes();
        static constexpr std::size_t kMaxTargets = 3;
        static constexpr std::size_t kMaxAnchors = 5;

        // Required: timestamp, symbol, signal, position_size
        static std::vector<core::Signal> validateSignals(const Table& table);

        // Long layout (timestamp, symbol[, timeframe], open/high/low/close[, volume])
        // or wide layout (timestamp, <field>_<SYMBOL>_<TIMEFRAME>...).
        static std::vector<core::Candle> validateCandles(const Table& table, const std::string& default_timeframe);

        // Candles that did not come through a table (e.g. the SQLite store):
        // non-empty symbol and a known timeframe per record
        static void validateCandleRecords(const std::vector<core::Candle>& candles, const std::string& source);

        // Post-run checks: no NaN cash / portfolio value, required columns present
        static void validateTradeLog(const std::vector<core::TradeLogEntry>& entries);
        static void validateTradeLogTable(const Table& table);

        static void validateUniverse(const core::UniverseConfig& universe);
        static void validateSignalSymbols(const std::vector<core::Signal>& signals, const core::UniverseConfig& universe);

        // Number of complete BUY/SELL pairs, i.e. min(#BUY, #SELL)
        static std::size_t countTradePairs(const std::vector<core::Signal>& signals);
        static void validateMinimumTradePairs(const std::vector<core::Signal>& signals, int min_pairs);

        static const std::vector<std::string>& requiredSignalColumns();
        static const std::vector<std::string>& requiredTradeLogColumns();
    };

} // namespace data
