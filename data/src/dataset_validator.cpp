#include "dataset_validator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace data {

    namespace {

        // Collects value-level problems so one error can report all of them
        class IssueCollector {
        public:
            void add(std::string issue) {
                ++total_;
                if (issues_.size() < DatasetValidator::kMaxReportedIssues) {
                    issues_.push_back(std::move(issue));
                }
            }
            bool empty() const { return total_ == 0; }
            std::string summary() const {
                std::string text = fmt::format("{}", fmt::join(issues_, "; "));
                if (total_ > issues_.size()) {
                    text += fmt::format("; ... and {} more", total_ - issues_.size());
                }
                return text;
            }
            std::size_t total() const { return total_; }

        private:
            std::vector<std::string> issues_;
            std::size_t total_ = 0;
        };

        std::vector<std::string> missingColumns(const Table& table, const std::vector<std::string>& required) {
            std::vector<std::string> missing;
            for (const auto& name : required) {
                if (!table.hasColumn(name)) missing.push_back(name);
            }
            return missing;
        }

        // Empty cell -> NaN (missing value). Returns false for unparseable text.
        bool parseNumericCell(const std::string& cell, double& out) {
            if (core::utils::trim(cell).empty()) {
                out = std::numeric_limits<double>::quiet_NaN();
                return true;
            }
            auto parsed = core::utils::parseDouble(cell);
            if (!parsed) return false;
            out = *parsed;
            return true;
        }

        const std::set<std::string>& candleFields() {
            static const std::set<std::string> fields{"open", "high", "low", "close", "volume"};
            return fields;
        }

        struct SeriesColumns {
            std::optional<std::size_t> open;
            std::optional<std::size_t> high;
            std::optional<std::size_t> low;
            std::optional<std::size_t> close;
            std::optional<std::size_t> volume;

            void assign(const std::string& field, std::size_t index) {
                if (field == "open") open = index;
                else if (field == "high") high = index;
                else if (field == "low") low = index;
                else if (field == "close") close = index;
                else if (field == "volume") volume = index;
            }
            bool hasPrice() const { return open || high || low || close; }
        };

        struct WideColumn {
            std::string field;
            std::string symbol;
            std::string timeframe;
        };

        // "close_LDO_1H" -> {close, LDO, 1H}. Symbols may themselves contain underscores.
        std::optional<WideColumn> parseWideColumn(const std::string& name) {
            const auto first = name.find('_');
            const auto last = name.rfind('_');
            if (first == std::string::npos || first == last) return std::nullopt;

            WideColumn column;
            column.field = core::utils::toLower(name.substr(0, first));
            column.symbol = name.substr(first + 1, last - first - 1);
            column.timeframe = name.substr(last + 1);
            if (candleFields().count(column.field) == 0 || column.symbol.empty() ||
                !core::utils::isKnownTimeframe(column.timeframe)) {
                return std::nullopt;
            }
            return column;
        }

        std::vector<core::Candle> parseLongCandles(const Table& table, const std::string& default_timeframe,
                                                   IssueCollector& issues) {
            const std::size_t ts_col = *table.columnIndex("timestamp");
            const std::size_t symbol_col = *table.columnIndex("symbol");
            const auto timeframe_col = table.columnIndex("timeframe");

            SeriesColumns cols;
            for (const auto& field : candleFields()) {
                if (auto idx = table.columnIndex(field)) cols.assign(field, *idx);
            }
            if (!cols.hasPrice()) {
                throw core::SchemaException(fmt::format(
                    "Candles dataset '{}' has no price column (expected one of open, high, low, close).", table.source));
            }

            std::vector<core::Candle> candles;
            candles.reserve(table.rows.size());
            for (std::size_t r = 0; r < table.rows.size(); ++r) {
                const auto& row = table.rows[r];
                core::Candle candle;
                bool row_ok = true;
                try {
                    candle.timestamp = core::utils::stringToTimestamp(row[ts_col]);
                } catch (const std::exception& e) {
                    issues.add(fmt::format("row {}: {}", r + 1, e.what()));
                    row_ok = false;
                }
                candle.symbol = row[symbol_col];
                if (candle.symbol.empty()) {
                    issues.add(fmt::format("row {}: empty symbol", r + 1));
                    row_ok = false;
                }
                candle.timeframe = (timeframe_col && !row[*timeframe_col].empty()) ? row[*timeframe_col] : default_timeframe;
                if (!core::utils::isKnownTimeframe(candle.timeframe)) {
                    issues.add(fmt::format("row {}: unknown timeframe '{}'", r + 1, candle.timeframe));
                    row_ok = false;
                }

                const std::pair<const std::optional<std::size_t>*, double*> targets[] = {
                    {&cols.open, &candle.open}, {&cols.high, &candle.high}, {&cols.low, &candle.low},
                    {&cols.close, &candle.close}, {&cols.volume, &candle.volume}};
                for (const auto& target : targets) {
                    if (!*target.first) continue;
                    const std::string& cell = row[**target.first];
                    if (!parseNumericCell(cell, *target.second)) {
                        issues.add(fmt::format("row {}: non-numeric value '{}' in column '{}'",
                                               r + 1, cell, table.columns[**target.first]));
                        row_ok = false;
                    }
                }
                if (std::isnan(candle.volume)) candle.volume = 0.0;
                if (row_ok) candles.push_back(std::move(candle));
            }
            return candles;
        }

        std::vector<core::Candle> parseWideCandles(const Table& table, IssueCollector& issues) {
            auto logger = core::logging::getLogger();
            const std::size_t ts_col = *table.columnIndex("timestamp");

            std::map<std::pair<std::string, std::string>, SeriesColumns> series;
            for (std::size_t c = 0; c < table.columns.size(); ++c) {
                if (c == ts_col) continue;
                auto parsed = parseWideColumn(table.columns[c]);
                if (!parsed) {
                    logger->debug("Ignoring candle column '{}' (not <field>_<SYMBOL>_<TIMEFRAME>)", table.columns[c]);
                    continue;
                }
                series[{parsed->symbol, parsed->timeframe}].assign(parsed->field, c);
            }

            // A series needs at least one price column; volume alone cannot be priced
            for (auto it = series.begin(); it != series.end();) {
                if (!it->second.hasPrice()) {
                    logger->warn("Candle series {}_{} has no price columns; ignoring it.", it->first.first, it->first.second);
                    it = series.erase(it);
                } else {
                    ++it;
                }
            }
            if (series.empty()) {
                throw core::SchemaException(fmt::format(
                    "Candles dataset '{}' has no price columns (expected 'symbol' + 'close' or '<field>_<SYMBOL>_<TIMEFRAME>' columns).",
                    table.source));
            }

            std::vector<core::Candle> candles;
            for (std::size_t r = 0; r < table.rows.size(); ++r) {
                const auto& row = table.rows[r];
                core::Timestamp ts;
                try {
                    ts = core::utils::stringToTimestamp(row[ts_col]);
                } catch (const std::exception& e) {
                    issues.add(fmt::format("row {}: {}", r + 1, e.what()));
                    continue;
                }

                for (const auto& entry : series) {
                    const SeriesColumns& cols = entry.second;
                    const std::optional<std::size_t> indices[] = {cols.open, cols.high, cols.low, cols.close};
                    // Every price cell empty: this series has no candle at this timestamp
                    bool any_price = false;
                    for (const auto& idx : indices) {
                        if (idx && !row[*idx].empty()) any_price = true;
                    }
                    if (!any_price) continue;

                    core::Candle candle;
                    candle.timestamp = ts;
                    candle.symbol = entry.first.first;
                    candle.timeframe = entry.first.second;
                    bool row_ok = true;
                    const std::pair<const std::optional<std::size_t>*, double*> targets[] = {
                        {&cols.open, &candle.open}, {&cols.high, &candle.high}, {&cols.low, &candle.low},
                        {&cols.close, &candle.close}, {&cols.volume, &candle.volume}};
                    for (const auto& target : targets) {
                        if (!*target.first) continue;
                        const std::string& cell = row[**target.first];
                        if (!parseNumericCell(cell, *target.second)) {
                            issues.add(fmt::format("row {}: non-numeric value '{}' in column '{}'",
                                                   r + 1, cell, table.columns[**target.first]));
                            row_ok = false;
                        }
                    }
                    if (std::isnan(candle.volume)) candle.volume = 0.0;
                    if (row_ok) candles.push_back(std::move(candle));
                }
            }
            return candles;
        }

    } // end anonymous namespace

    const std::vector<std::string>& DatasetValidator::allowedUniverseTimeframes() {
        static const std::vector<std::string> timeframes{"1H", "2H", "4H", "12H", "1D"};
        return timeframes;
    }

    const std::vector<std::string>& DatasetValidator::requiredSignalColumns() {
        static const std::vector<std::string> columns{"timestamp", "symbol", "signal", "position_size"};
        return columns;
    }

    const std::vector<std::string>& DatasetValidator::requiredTradeLogColumns() {
        static const std::vector<std::string> columns{"timestamp", "action", "symbol", "cash", "portfolio_value",
                                                      "shares", "price", "fees"};
        return columns;
    }

    std::vector<core::Signal> DatasetValidator::validateSignals(const Table& table) {
        auto logger = core::logging::getLogger();
        logger->info("Validating signals dataset '{}' ({} rows)...", table.source, table.rowCount());

        const auto missing = missingColumns(table, requiredSignalColumns());
        if (!missing.empty()) {
            throw core::SchemaException(fmt::format("Signals dataset '{}' is missing required column(s): {}",
                                                    table.source, fmt::join(missing, ", ")));
        }

        const std::size_t ts_col = *table.columnIndex("timestamp");
        const std::size_t symbol_col = *table.columnIndex("symbol");
        const std::size_t signal_col = *table.columnIndex("signal");
        const std::size_t size_col = *table.columnIndex("position_size");

        IssueCollector issues;
        std::vector<core::Signal> signals;
        signals.reserve(table.rows.size());

        for (std::size_t r = 0; r < table.rows.size(); ++r) {
            const auto& row = table.rows[r];
            core::Signal signal;
            bool row_ok = true;

            try {
                signal.timestamp = core::utils::stringToTimestamp(row[ts_col]);
            } catch (const std::exception& e) {
                issues.add(fmt::format("row {}: {}", r + 1, e.what()));
                row_ok = false;
            }

            signal.symbol = row[symbol_col];
            if (signal.symbol.empty()) {
                issues.add(fmt::format("row {}: empty symbol", r + 1));
                row_ok = false;
            }

            const std::string action = core::utils::toUpper(row[signal_col]);
            if (action == "BUY") {
                signal.signal = core::SignalType::Buy;
            } else if (action == "SELL") {
                signal.signal = core::SignalType::Sell;
            } else if (action == "HOLD") {
                signal.signal = core::SignalType::Hold;
            } else {
                issues.add(fmt::format("row {}: signal '{}' not in {{BUY, SELL, HOLD}}", r + 1, row[signal_col]));
                row_ok = false;
            }

            auto size = core::utils::parseDouble(row[size_col]);
            if (!size || !std::isfinite(*size) || *size < 0.0 || *size > 1.0) {
                issues.add(fmt::format("row {}: position_size '{}' not within [0.0, 1.0]", r + 1, row[size_col]));
                row_ok = false;
            } else {
                signal.position_size = *size;
            }

            if (row_ok) signals.push_back(std::move(signal));
        }

        if (!issues.empty()) {
            throw core::SchemaException(fmt::format("Signals dataset '{}' has {} invalid value(s): {}",
                                                    table.source, issues.total(), issues.summary()));
        }
        if (signals.empty()) {
            logger->warn("Signals dataset '{}' contains no rows.", table.source);
        }
        logger->info("Signals dataset valid: {} signal(s).", signals.size());
        return signals;
    }

    std::vector<core::Candle> DatasetValidator::validateCandles(const Table& table, const std::string& default_timeframe) {
        auto logger = core::logging::getLogger();
        logger->info("Validating candles dataset '{}' ({} rows)...", table.source, table.rowCount());

        if (!table.hasColumn("timestamp")) {
            throw core::SchemaException(fmt::format("Candles dataset '{}' is missing required column(s): timestamp",
                                                    table.source));
        }

        IssueCollector issues;
        std::vector<core::Candle> candles;
        if (table.hasColumn("symbol")) {
            logger->debug("Candles dataset '{}' uses the long layout.", table.source);
            candles = parseLongCandles(table, default_timeframe, issues);
        } else {
            logger->debug("Candles dataset '{}' uses the wide layout.", table.source);
            candles = parseWideCandles(table, issues);
        }

        if (!issues.empty()) {
            throw core::SchemaException(fmt::format("Candles dataset '{}' has {} invalid value(s): {}",
                                                    table.source, issues.total(), issues.summary()));
        }
        logger->info("Candles dataset valid: {} candle(s).", candles.size());
        return candles;
    }

    void DatasetValidator::validateCandleRecords(const std::vector<core::Candle>& candles, const std::string& source) {
        IssueCollector issues;
        for (std::size_t i = 0; i < candles.size(); ++i) {
            const auto& candle = candles[i];
            if (candle.symbol.empty()) {
                issues.add(fmt::format("record {}: empty symbol", i + 1));
            }
            if (!core::utils::isKnownTimeframe(candle.timeframe)) {
                issues.add(fmt::format("record {}: unknown timeframe '{}' for '{}'", i + 1, candle.timeframe, candle.symbol));
            }
        }
        if (!issues.empty()) {
            throw core::SchemaException(fmt::format("Candles from '{}' have {} invalid value(s): {}",
                                                    source, issues.total(), issues.summary()));
        }
        core::logging::getLogger()->debug("Candle records from '{}' valid: {} candle(s).", source, candles.size());
    }

    void DatasetValidator::validateTradeLog(const std::vector<core::TradeLogEntry>& entries) {
        for (std::size_t i = 0; i < entries.size(); ++i) {
            const auto& entry = entries[i];
            const std::pair<const char*, double> checked[] = {
                {"cash", entry.cash_after}, {"portfolio_value", entry.portfolio_value_after}};
            for (const auto& column : checked) {
                if (!std::isfinite(column.second)) {
                    throw core::IntegrityException(fmt::format(
                        "Trade log contains a missing (NaN) or non-finite '{}' value at row {} ({} {} at {}).",
                        column.first, i + 1, core::toString(entry.action), entry.symbol,
                        core::utils::timestampToString(entry.timestamp)));
                }
            }
        }
    }

    void DatasetValidator::validateTradeLogTable(const Table& table) {
        const auto missing = missingColumns(table, requiredTradeLogColumns());
        if (!missing.empty()) {
            throw core::IntegrityException(fmt::format("Trade log '{}' is missing required column(s): {}",
                                                       table.source, fmt::join(missing, ", ")));
        }
        for (const char* name : {"cash", "portfolio_value"}) {
            const std::size_t col = *table.columnIndex(name);
            for (std::size_t r = 0; r < table.rows.size(); ++r) {
                auto value = core::utils::parseDouble(table.rows[r][col]);
                if (!value || !std::isfinite(*value)) {
                    throw core::IntegrityException(fmt::format(
                        "Trade log '{}' contains a missing (NaN) or non-finite '{}' value at row {}.",
                        table.source, name, r + 1));
                }
            }
        }
    }

    void DatasetValidator::validateUniverse(const core::UniverseConfig& universe) {
        if (universe.empty()) return;

        if (universe.targets.empty()) {
            throw core::ConfigException("Universe must define at least one target symbol.");
        }
        if (universe.targets.size() > kMaxTargets) {
            throw core::ConfigException(fmt::format("Universe defines {} targets; at most {} are allowed.",
                                                    universe.targets.size(), kMaxTargets));
        }
        if (universe.anchors.size() > kMaxAnchors) {
            throw core::ConfigException(fmt::format("Universe defines {} anchors; at most {} are allowed.",
                                                    universe.anchors.size(), kMaxAnchors));
        }

        const auto& allowed = allowedUniverseTimeframes();
        std::set<std::pair<std::string, std::string>> seen;
        auto check = [&](const core::UniverseEntry& entry, const char* role) {
            if (entry.symbol.empty()) {
                throw core::ConfigException(fmt::format("Universe {} entry has an empty symbol.", role));
            }
            if (std::find(allowed.begin(), allowed.end(), entry.timeframe) == allowed.end()) {
                throw core::ConfigException(fmt::format("Universe {} '{}' uses timeframe '{}'; allowed: {}",
                                                        role, entry.symbol, entry.timeframe, fmt::join(allowed, ", ")));
            }
            if (!seen.insert({entry.symbol, entry.timeframe}).second) {
                throw core::ConfigException(fmt::format("Universe lists {} {} more than once.", entry.symbol, entry.timeframe));
            }
        };
        for (const auto& target : universe.targets) check(target, "target");
        for (const auto& anchor : universe.anchors) check(anchor, "anchor");
    }

    void DatasetValidator::validateSignalSymbols(const std::vector<core::Signal>& signals,
                                                 const core::UniverseConfig& universe) {
        if (universe.targets.empty()) return;

        std::set<std::string> targets;
        for (const auto& target : universe.targets) targets.insert(target.symbol);

        std::set<std::string> unknown;
        for (const auto& signal : signals) {
            if (targets.count(signal.symbol) == 0) unknown.insert(signal.symbol);
        }
        if (!unknown.empty()) {
            throw core::SchemaException(fmt::format("Signals reference symbol(s) that are not configured targets: {}",
                                                    fmt::join(unknown, ", ")));
        }
    }

    std::size_t DatasetValidator::countTradePairs(const std::vector<core::Signal>& signals) {
        std::size_t buys = 0;
        std::size_t sells = 0;
        for (const auto& signal : signals) {
            if (signal.signal == core::SignalType::Buy) ++buys;
            else if (signal.signal == core::SignalType::Sell) ++sells;
        }
        return std::min(buys, sells);
    }

    void DatasetValidator::validateMinimumTradePairs(const std::vector<core::Signal>& signals, int min_pairs) {
        if (min_pairs <= 0) return;
        const std::size_t pairs = countTradePairs(signals);
        if (pairs < static_cast<std::size_t>(min_pairs)) {
            throw core::SchemaException(fmt::format("Signals contain {} buy-sell pair(s); at least {} required.",
                                                    pairs, min_pairs));
        }
    }

} // namespace data
