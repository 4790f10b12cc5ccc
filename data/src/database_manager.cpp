#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace data
{

    namespace
    {
        // Timestamps are stored as INTEGER epoch milliseconds so that ORDER BY is chronological
        long long toEpochMillis(core::Timestamp ts)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
        }

        core::Timestamp fromEpochMillis(long long ms)
        {
            return core::Timestamp(std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(ms)));
        }
    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (connected_)
        {
            core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
            int rc = sqlite3_close(db_);
            if (rc != SQLITE_OK)
            {
                // This usually happens if prepared statements are not finalized
                core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
            }
            db_ = nullptr;
            connected_ = false;
        }
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS candles (
            symbol TEXT NOT NULL,
            timeframe TEXT NOT NULL,
            timestamp INTEGER NOT NULL, -- epoch milliseconds, UTC
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume REAL,
            PRIMARY KEY (symbol, timeframe, timestamp)
        );
    )";

        const std::string create_runs_sql = R"(
        CREATE TABLE IF NOT EXISTS simulation_runs (
            run_id TEXT PRIMARY KEY,
            initial_cash REAL NOT NULL,
            fee_rate REAL NOT NULL,
            final_cash REAL NOT NULL,
            final_portfolio_value REAL NOT NULL,
            signals_processed INTEGER NOT NULL,
            rejected_signals INTEGER NOT NULL
        );
    )";

        const std::string create_trade_log_sql = R"(
        CREATE TABLE IF NOT EXISTS trade_log (
            run_id TEXT NOT NULL,
            seq INTEGER NOT NULL,
            timestamp INTEGER NOT NULL,
            action TEXT NOT NULL,
            symbol TEXT NOT NULL,
            shares REAL NOT NULL,
            price REAL NOT NULL,
            fees REAL NOT NULL,
            cash REAL NOT NULL,
            portfolio_value REAL NOT NULL,
            cost_basis REAL,
            realized_pnl REAL,
            PRIMARY KEY (run_id, seq)
        );
    )";

        const std::string create_equity_sql = R"(
        CREATE TABLE IF NOT EXISTS equity_curve (
            run_id TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            cash REAL NOT NULL,
            positions_value REAL NOT NULL,
            portfolio_value REAL NOT NULL,
            PRIMARY KEY (run_id, timestamp)
        );
    )";

        bool success = true;
        success &= executeSQL(create_candles_sql);
        success &= executeSQL(create_runs_sql);
        success &= executeSQL(create_trade_log_sql);
        success &= executeSQL(create_equity_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::runCandleQuery(sqlite3_stmt *stmt)
    {
        auto logger = core::logging::getLogger();
        core::TimeSeries<core::Candle> candles;

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            core::Candle candle;
            const unsigned char *symbol_text = sqlite3_column_text(stmt, 0);
            const unsigned char *tf_text = sqlite3_column_text(stmt, 1);
            candle.symbol = symbol_text ? reinterpret_cast<const char *>(symbol_text) : "";
            candle.timeframe = tf_text ? reinterpret_cast<const char *>(tf_text) : "";
            candle.timestamp = fromEpochMillis(sqlite3_column_int64(stmt, 2));

            // NULL price columns stay NaN so the resolver rejects them explicitly
            double *fields[] = {&candle.open, &candle.high, &candle.low, &candle.close};
            for (int i = 0; i < 4; ++i)
            {
                if (sqlite3_column_type(stmt, 3 + i) != SQLITE_NULL)
                {
                    *fields[i] = sqlite3_column_double(stmt, 3 + i);
                }
            }
            candle.volume = sqlite3_column_double(stmt, 7);
            candles.push_back(std::move(candle));
        }

        if (rc != SQLITE_DONE)
        {
            const std::string message = sqlite3_errmsg(db_);
            logger->error("Error stepping through candle query results [{}]: {}", rc, message);
            sqlite3_finalize(stmt);
            throw core::DataLoadException("Candle query failed: " + message);
        }
        sqlite3_finalize(stmt);
        logger->debug("Candle query returned {} rows.", candles.size());
        return candles;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string &symbol,
        const std::string &timeframe,
        std::optional<core::Timestamp> start_time,
        std::optional<core::Timestamp> end_time)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query candles: Not connected to database.");
        }

        core::logging::getLogger()->debug("Querying candles for {} ({}) between {} and {}", symbol, timeframe,
                                          start_time ? core::utils::timestampToString(*start_time) : "-inf",
                                          end_time ? core::utils::timestampToString(*end_time) : "+inf");

        const char *sql = R"(
            SELECT symbol, timeframe, timestamp, open, high, low, close, volume
            FROM candles
            WHERE symbol = ?
              AND timeframe = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            sqlite3_finalize(stmt);
            throw core::DataLoadException(std::string("Failed to prepare candle query: ") + sqlite3_errmsg(db_));
        }

        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, timeframe.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, start_time ? toEpochMillis(*start_time) : INT64_MIN);
        sqlite3_bind_int64(stmt, 4, end_time ? toEpochMillis(*end_time) : INT64_MAX);

        return runCandleQuery(stmt);
    }

    core::TimeSeries<core::Candle> DatabaseManager::loadCandles(
        const std::vector<std::string> &symbols,
        const std::vector<std::string> &timeframes,
        std::optional<core::Timestamp> start_time,
        std::optional<core::Timestamp> end_time)
    {
        core::TimeSeries<core::Candle> candles;
        for (const auto &symbol : symbols)
        {
            for (const auto &timeframe : timeframes)
            {
                auto series = queryCandles(symbol, timeframe, start_time, end_time);
                candles.insert(candles.end(), series.begin(), series.end());
            }
        }
        core::logging::getLogger()->info("Loaded {} candles for {} symbol(s) across {} timeframe(s) from {}",
                                         candles.size(), symbols.size(), timeframes.size(), database_path_);
        return candles;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            core::logging::getLogger()->debug("No candles provided to save.");
            return true; // Nothing to do, report success
        }

        const char *sql = R"(
INSERT OR IGNORE INTO candles
(symbol, timeframe, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            core::logging::getLogger()->error("Failed to begin transaction for saving candles.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            sqlite3_bind_text(stmt, 1, candle.symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, candle.timeframe.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, toEpochMillis(candle.timestamp));

            // SQLite stores NaN as NULL; bind it explicitly
            const double fields[] = {candle.open, candle.high, candle.low, candle.close};
            for (int i = 0; i < 4; ++i)
            {
                if (fields[i] != fields[i])
                    sqlite3_bind_null(stmt, 4 + i);
                else
                    sqlite3_bind_double(stmt, 4 + i, fields[i]);
            }
            sqlite3_bind_double(stmt, 8, candle.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                core::logging::getLogger()->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                core::logging::getLogger()->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            core::logging::getLogger()->error("Failed to {} transaction for saving candles.", success ? "COMMIT" : "ROLLBACK");
            if (success)
                executeSQL("ROLLBACK;");
            return false;
        }

        if (success)
        {
            core::logging::getLogger()->info("Saved {} new candles (duplicates ignored).", saved_count);
        }
        else
        {
            core::logging::getLogger()->warn("Transaction rolled back due to error during candle save.");
        }
        return success;
    }

    bool DatabaseManager::saveRun(const RunRecord &run,
                                  const std::vector<core::TradeLogEntry> &trade_log,
                                  const std::vector<core::PortfolioState> &equity_curve)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save run: Not connected to database.");
            return false;
        }

        const char *run_sql = R"(
INSERT OR REPLACE INTO simulation_runs
(run_id, initial_cash, fee_rate, final_cash, final_portfolio_value, signals_processed, rejected_signals)
VALUES (?, ?, ?, ?, ?, ?, ?);
)";
        const char *trade_sql = R"(
INSERT INTO trade_log
(run_id, seq, timestamp, action, symbol, shares, price, fees, cash, portfolio_value, cost_basis, realized_pnl)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)";
        const char *equity_sql = R"(
INSERT INTO equity_curve
(run_id, timestamp, cash, positions_value, portfolio_value)
VALUES (?, ?, ?, ?, ?);
)";

        sqlite3_stmt *run_stmt = nullptr;
        sqlite3_stmt *trade_stmt = nullptr;
        sqlite3_stmt *equity_stmt = nullptr;
        auto finalizeAll = [&]() {
            sqlite3_finalize(run_stmt);
            sqlite3_finalize(trade_stmt);
            sqlite3_finalize(equity_stmt);
        };

        if (sqlite3_prepare_v2(db_, run_sql, -1, &run_stmt, nullptr) != SQLITE_OK ||
            sqlite3_prepare_v2(db_, trade_sql, -1, &trade_stmt, nullptr) != SQLITE_OK ||
            sqlite3_prepare_v2(db_, equity_sql, -1, &equity_stmt, nullptr) != SQLITE_OK)
        {
            logger->error("Failed to prepare run persistence statements: {}", sqlite3_errmsg(db_));
            finalizeAll();
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            finalizeAll();
            return false;
        }

        bool success = true;
        for (const char *delete_sql : {"DELETE FROM trade_log WHERE run_id = ?;",
                                       "DELETE FROM equity_curve WHERE run_id = ?;"})
        {
            sqlite3_stmt *delete_stmt = nullptr;
            if (sqlite3_prepare_v2(db_, delete_sql, -1, &delete_stmt, nullptr) != SQLITE_OK)
            {
                logger->error("Failed to prepare cleanup statement: {}", sqlite3_errmsg(db_));
                success = false;
            }
            else
            {
                sqlite3_bind_text(delete_stmt, 1, run.run_id.c_str(), -1, SQLITE_TRANSIENT);
                if (sqlite3_step(delete_stmt) != SQLITE_DONE)
                {
                    logger->error("Failed to clear previous rows of run '{}': {}", run.run_id, sqlite3_errmsg(db_));
                    success = false;
                }
            }
            sqlite3_finalize(delete_stmt);
            if (!success)
                break;
        }

        if (success)
        {
            sqlite3_bind_text(run_stmt, 1, run.run_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(run_stmt, 2, run.initial_cash);
            sqlite3_bind_double(run_stmt, 3, run.fee_rate);
            sqlite3_bind_double(run_stmt, 4, run.final_cash);
            sqlite3_bind_double(run_stmt, 5, run.final_portfolio_value);
            sqlite3_bind_int64(run_stmt, 6, static_cast<sqlite3_int64>(run.signals_processed));
            sqlite3_bind_int64(run_stmt, 7, static_cast<sqlite3_int64>(run.rejected_signals));
            if (sqlite3_step(run_stmt) != SQLITE_DONE)
            {
                logger->error("Failed to insert run '{}': {}", run.run_id, sqlite3_errmsg(db_));
                success = false;
            }
        }

        for (std::size_t i = 0; success && i < trade_log.size(); ++i)
        {
            const auto &entry = trade_log[i];
            const std::string action = core::toString(entry.action);
            sqlite3_bind_text(trade_stmt, 1, run.run_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(trade_stmt, 2, static_cast<sqlite3_int64>(i));
            sqlite3_bind_int64(trade_stmt, 3, toEpochMillis(entry.timestamp));
            sqlite3_bind_text(trade_stmt, 4, action.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(trade_stmt, 5, entry.symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(trade_stmt, 6, entry.shares);
            sqlite3_bind_double(trade_stmt, 7, entry.price);
            sqlite3_bind_double(trade_stmt, 8, entry.fees);
            sqlite3_bind_double(trade_stmt, 9, entry.cash_after);
            sqlite3_bind_double(trade_stmt, 10, entry.portfolio_value_after);
            sqlite3_bind_double(trade_stmt, 11, entry.cost_basis);
            if (entry.action == core::TradeAction::Sell)
                sqlite3_bind_double(trade_stmt, 12, entry.realized_pnl);
            else
                sqlite3_bind_null(trade_stmt, 12);

            if (sqlite3_step(trade_stmt) != SQLITE_DONE)
            {
                logger->error("Failed to insert trade log row {}: {}", i, sqlite3_errmsg(db_));
                success = false;
            }
            sqlite3_reset(trade_stmt);
        }

        for (std::size_t i = 0; success && i < equity_curve.size(); ++i)
        {
            const auto &state = equity_curve[i];
            sqlite3_bind_text(equity_stmt, 1, run.run_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(equity_stmt, 2, toEpochMillis(state.timestamp));
            sqlite3_bind_double(equity_stmt, 3, state.cash);
            sqlite3_bind_double(equity_stmt, 4, state.positions_value);
            sqlite3_bind_double(equity_stmt, 5, state.total_equity);
            if (sqlite3_step(equity_stmt) != SQLITE_DONE)
            {
                logger->error("Failed to insert equity point {}: {}", i, sqlite3_errmsg(db_));
                success = false;
            }
            sqlite3_reset(equity_stmt);
        }

        finalizeAll();

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            if (success)
                executeSQL("ROLLBACK;");
            return false;
        }
        if (success)
        {
            logger->info("Persisted run '{}': {} trades, {} equity points.", run.run_id, trade_log.size(), equity_curve.size());
        }
        return success;
    }

    std::vector<core::TradeLogEntry> DatabaseManager::queryTradeLog(const std::string &run_id)
    {
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot query trade log: Not connected to database.");
        }

        const char *sql = R"(
            SELECT timestamp, action, symbol, shares, price, fees, cash, portfolio_value, cost_basis, realized_pnl
            FROM trade_log
            WHERE run_id = ?
            ORDER BY seq ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(stmt);
            throw core::DataLoadException(std::string("Failed to prepare trade log query: ") + sqlite3_errmsg(db_));
        }
        sqlite3_bind_text(stmt, 1, run_id.c_str(), -1, SQLITE_TRANSIENT);

        std::vector<core::TradeLogEntry> entries;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            core::TradeLogEntry entry;
            entry.timestamp = fromEpochMillis(sqlite3_column_int64(stmt, 0));
            const unsigned char *action = sqlite3_column_text(stmt, 1);
            entry.action = (action && std::string(reinterpret_cast<const char *>(action)) == "SELL")
                               ? core::TradeAction::Sell
                               : core::TradeAction::Buy;
            const unsigned char *symbol = sqlite3_column_text(stmt, 2);
            entry.symbol = symbol ? reinterpret_cast<const char *>(symbol) : "";
            entry.shares = sqlite3_column_double(stmt, 3);
            entry.price = sqlite3_column_double(stmt, 4);
            entry.fees = sqlite3_column_double(stmt, 5);
            entry.cash_after = sqlite3_column_double(stmt, 6);
            entry.portfolio_value_after = sqlite3_column_double(stmt, 7);
            entry.cost_basis = sqlite3_column_double(stmt, 8);
            entry.realized_pnl = sqlite3_column_double(stmt, 9);
            entries.push_back(std::move(entry));
        }
        if (rc != SQLITE_DONE)
        {
            const std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataLoadException("Trade log query failed: " + message);
        }
        sqlite3_finalize(stmt);
        return entries;
    }

} // namespace data
