#pragma once

#include <string>
#include <vector>
#include <optional>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

// Summary row stored for every persisted simulation run
struct RunRecord {
    std::string run_id;
    double initial_cash = 0.0;
    double fee_rate = 0.0;
    double final_cash = 0.0;
    double final_portfolio_value = 0.0;
    std::size_t signals_processed = 0;
    std::size_t rejected_signals = 0;
};

class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();
    bool executeSQL(const std::string& sql);

    // Inserts candles, ignoring rows whose (symbol, timeframe, timestamp) already exist
    bool saveCandles(const core::TimeSeries<core::Candle>& candles);

    core::TimeSeries<core::Candle> queryCandles(
        const std::string& symbol,
        const std::string& timeframe,
        std::optional<core::Timestamp> start_time = std::nullopt,
        std::optional<core::Timestamp> end_time = std::nullopt);

    // Candles for each symbol/timeframe combination within the optional time window
    core::TimeSeries<core::Candle> loadCandles(
        const std::vector<std::string>& symbols,
        const std::vector<std::string>& timeframes,
        std::optional<core::Timestamp> start_time = std::nullopt,
        std::optional<core::Timestamp> end_time = std::nullopt);

    // Replaces any earlier run stored under the same id
    bool saveRun(const RunRecord& run,
                 const std::vector<core::TradeLogEntry>& trade_log,
                 const std::vector<core::PortfolioState>& equity_curve);

    std::vector<core::TradeLogEntry> queryTradeLog(const std::string& run_id);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;

    core::TimeSeries<core::Candle> runCandleQuery(sqlite3_stmt* stmt);
};

} // namespace data
